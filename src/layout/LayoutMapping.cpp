#include "LayoutMapping.hpp"
#include <algorithm>
#include <stdexcept>

LayoutMapping LayoutMapping::build(const KeySpace& keySpace, const Layout& layout) {
    if (!isPermutationOf(layout, keySpace.symbols())) {
        throw std::invalid_argument("LayoutMapping: layout \"" + layout +
                                    "\" is not a permutation of the key space symbols");
    }
    return buildUnchecked(keySpace, layout);
}

LayoutMapping LayoutMapping::buildUnchecked(const KeySpace& keySpace, const Layout& layout) {
    LayoutMapping mapping;
    size_t n = std::min(layout.size(), keySpace.size());
    for (size_t i = 0; i < n; ++i) {
        unsigned char logical = static_cast<unsigned char>(layout[i]);
        if (mapping.physical_[logical] == '\0') mapping.count_++;
        mapping.physical_[logical] = keySpace.symbolAt(i);
    }
    return mapping;
}
