#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

// --- Data Definitions ---

// Logical n-gram -> occurrence count in the corpus
using FrequencyTable = std::unordered_map<std::string, std::int64_t>;

// Physical n-gram -> mean typing time in milliseconds
using TimingTable = std::unordered_map<std::string, double>;

struct NgramFrequencies {
    FrequencyTable unigrams;
    FrequencyTable bigrams;
    FrequencyTable trigrams;

    const FrequencyTable& forOrder(size_t n) const {
        return n == 1 ? unigrams : (n == 2 ? bigrams : trigrams);
    }
};

struct NgramTimings {
    TimingTable unigrams;
    TimingTable bigrams;
    TimingTable trigrams;

    const TimingTable& forOrder(size_t n) const {
        return n == 1 ? unigrams : (n == 2 ? bigrams : trigrams);
    }
};
