#pragma once
#include "KeySpace.hpp"
#include <array>

/**
 * @brief Logical symbol -> physical key lookup derived from a Layout.
 *
 * Built by pairing layout[i] with keySpace.symbolAt(i). A layout shorter
 * than the key space maps only its prefix; symbols it does not contain
 * have no physical key.
 */
class LayoutMapping {
public:
    /**
     * @brief Build the mapping after checking that layout is a permutation
     * of the key space symbols.
     * @throws std::invalid_argument if it is not.
     */
    static LayoutMapping build(const KeySpace& keySpace, const Layout& layout);

    // Hot path: no validation.
    static LayoutMapping buildUnchecked(const KeySpace& keySpace, const Layout& layout);

    // '\0' when the logical symbol has no physical key
    char physicalFor(char logical) const {
        return physical_[static_cast<unsigned char>(logical)];
    }

    bool contains(char logical) const { return physicalFor(logical) != '\0'; }

    size_t size() const { return count_; }

private:
    LayoutMapping() { physical_.fill('\0'); }

    std::array<char, 256> physical_;
    size_t count_ = 0;
};
