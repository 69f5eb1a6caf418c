#pragma once
#include <cstddef>
#include <string>
#include <vector>

// A layout assigns logical symbols to physical keys: layout[i] is the symbol
// typed by the physical key KeySpace::symbolAt(i).
using Layout = std::string;

enum class KeyGroup {
    LETTERS,
    DIGITS,
    SYMBOLS
};

struct KeyPartition {
    std::vector<size_t> letters;
    std::vector<size_t> digits;
    std::vector<size_t> symbols;
};

/**
 * @brief Fixed, ordered set of physical key positions.
 *
 * Positions are addressed by index 0..size()-1 and grouped into rows
 * (top to bottom) for display and for group-restricted permutations.
 * A KeySpace never changes once constructed.
 */
class KeySpace {
public:
    /**
     * @param symbols One distinct symbol per physical key, row-major order.
     * @param rowSizes Number of keys in each row; must sum to symbols.size().
     * @throws std::invalid_argument on duplicate symbols or inconsistent rows.
     */
    KeySpace(std::string symbols, std::vector<size_t> rowSizes);

    /**
     * @brief The reference QWERTY-like configuration (46 keys, rows 12/13/11/10).
     */
    static const KeySpace& standard();

    size_t size() const { return symbols_.size(); }
    char symbolAt(size_t index) const { return symbols_.at(index); }
    const std::string& symbols() const { return symbols_; }
    const std::vector<size_t>& rowSizes() const { return rowSizes_; }

    size_t rowOf(size_t index) const { return rowOfIndex_.at(index); }
    size_t columnOf(size_t index) const;
    size_t rowStart(size_t row) const { return rowStarts_.at(row); }

    // -1 when the symbol is not a key of this space
    int indexOf(char symbol) const;
    bool contains(char symbol) const { return indexOf(symbol) >= 0; }

    // The identity assignment: every key types its own symbol.
    Layout canonicalLayout() const { return symbols_; }

    const KeyPartition& partitionIndices() const { return partition_; }
    const std::vector<size_t>& indicesFor(KeyGroup group) const;

private:
    std::string symbols_;
    std::vector<size_t> rowSizes_;
    std::vector<size_t> rowStarts_;
    std::vector<size_t> rowOfIndex_;
    std::vector<int> indexOfSymbol_; // 256 entries, one per byte value
    KeyPartition partition_;
};

/**
 * @brief True if candidate holds exactly the same symbols as reference
 * (same length, no duplicates introduced, none missing).
 */
bool isPermutationOf(const std::string& candidate, const std::string& reference);
