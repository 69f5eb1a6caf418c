#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class PermutationMode {
    FULL,
    RESTRICTED
};

/**
 * @brief Which layout positions the genetic operators may write.
 *
 * FULL: every position is permutable.
 * RESTRICTED: only the listed indices are permutable; every other position
 * keeps its canonical symbol for the whole run.
 */
class PermutationStrategy {
public:
    static PermutationStrategy full() { return PermutationStrategy(PermutationMode::FULL, {}); }

    static PermutationStrategy restricted(std::vector<size_t> indices) {
        return PermutationStrategy(PermutationMode::RESTRICTED, std::move(indices));
    }

    PermutationMode getMode() const { return mode; }
    bool isRestricted() const { return mode == PermutationMode::RESTRICTED; }

    // Only meaningful for RESTRICTED
    const std::vector<size_t>& getIndices() const { return indices; }

    /**
     * @brief Permutable positions for a layout of the given length.
     */
    std::vector<size_t> permutablePositions(size_t layoutSize) const;

    /**
     * @brief Checks the strategy against a layout length.
     * @throws std::invalid_argument for fewer than 2 indices, indices out of
     * range, or duplicate indices.
     */
    void validate(size_t layoutSize) const;

    static std::string getModeName(PermutationMode mode) {
        switch (mode) {
            case PermutationMode::FULL: return "Full permutation";
            case PermutationMode::RESTRICTED: return "Restricted permutation";
            default: return "Unknown";
        }
    }

private:
    PermutationStrategy(PermutationMode m, std::vector<size_t> idx)
        : mode(m), indices(std::move(idx)) {}

    PermutationMode mode;
    std::vector<size_t> indices;
};
