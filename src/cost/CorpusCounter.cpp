#include "CorpusCounter.hpp"
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

NgramFrequencies countNgrams(std::istream& text, const std::string& allowedAlphabet) {
    std::array<bool, 256> allowed{};
    for (char c : allowedAlphabet) allowed[static_cast<unsigned char>(c)] = true;

    std::string filtered;
    for (std::istreambuf_iterator<char> it(text), end; it != end; ++it) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(*it)));
        if (allowed[static_cast<unsigned char>(c)]) filtered.push_back(c);
    }

    NgramFrequencies freq;
    for (size_t i = 0; i < filtered.size(); ++i) {
        freq.unigrams[filtered.substr(i, 1)]++;
        if (i + 2 <= filtered.size()) freq.bigrams[filtered.substr(i, 2)]++;
        if (i + 3 <= filtered.size()) freq.trigrams[filtered.substr(i, 3)]++;
    }
    return freq;
}

NgramFrequencies countNgramsInFile(const std::string& path, const std::string& allowedAlphabet) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open corpus file: " + path);
    }
    return countNgrams(in, allowedAlphabet);
}
