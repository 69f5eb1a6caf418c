#include "KeySpace.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>
#include <stdexcept>

namespace {

KeyGroup classify(char symbol) {
    unsigned char c = static_cast<unsigned char>(symbol);
    if (std::isalpha(c)) return KeyGroup::LETTERS;
    if (std::isdigit(c)) return KeyGroup::DIGITS;
    return KeyGroup::SYMBOLS;
}

} // namespace

KeySpace::KeySpace(std::string symbols, std::vector<size_t> rowSizes)
    : symbols_(std::move(symbols)), rowSizes_(std::move(rowSizes)), indexOfSymbol_(256, -1) {

    size_t total = std::accumulate(rowSizes_.begin(), rowSizes_.end(), size_t{0});
    if (total != symbols_.size()) {
        throw std::invalid_argument("KeySpace: row sizes sum to " + std::to_string(total) +
                                    " but " + std::to_string(symbols_.size()) + " symbols were given");
    }

    for (size_t i = 0; i < symbols_.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(symbols_[i]);
        if (indexOfSymbol_[c] != -1) {
            throw std::invalid_argument(std::string("KeySpace: duplicate symbol '") + symbols_[i] + "'");
        }
        indexOfSymbol_[c] = static_cast<int>(i);
    }

    size_t start = 0;
    for (size_t row = 0; row < rowSizes_.size(); ++row) {
        rowStarts_.push_back(start);
        for (size_t k = 0; k < rowSizes_[row]; ++k) {
            rowOfIndex_.push_back(row);
        }
        start += rowSizes_[row];
    }

    for (size_t i = 0; i < symbols_.size(); ++i) {
        switch (classify(symbols_[i])) {
            case KeyGroup::LETTERS: partition_.letters.push_back(i); break;
            case KeyGroup::DIGITS:  partition_.digits.push_back(i); break;
            case KeyGroup::SYMBOLS: partition_.symbols.push_back(i); break;
        }
    }
}

const KeySpace& KeySpace::standard() {
    static const KeySpace instance(
        "1234567890-="
        "qwertyuiop[]\\"
        "asdfghjkl;'"
        "zxcvbnm,./",
        {12, 13, 11, 10});
    return instance;
}

size_t KeySpace::columnOf(size_t index) const {
    return index - rowStarts_.at(rowOf(index));
}

int KeySpace::indexOf(char symbol) const {
    return indexOfSymbol_[static_cast<unsigned char>(symbol)];
}

const std::vector<size_t>& KeySpace::indicesFor(KeyGroup group) const {
    switch (group) {
        case KeyGroup::LETTERS: return partition_.letters;
        case KeyGroup::DIGITS:  return partition_.digits;
        default:                return partition_.symbols;
    }
}

bool isPermutationOf(const std::string& candidate, const std::string& reference) {
    if (candidate.size() != reference.size()) return false;
    std::string a = candidate;
    std::string b = reference;
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    return a == b;
}
