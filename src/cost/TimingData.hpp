#pragma once
#include "KeySpace.hpp"
#include "NgramTables.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// --- Data Definitions ---

struct LetterTiming {
    std::string letter;
    std::optional<double> reactionTime;

    LetterTiming() = default;
    LetterTiming(std::string l, std::optional<double> t) : letter(std::move(l)), reactionTime(t) {}
};

/**
 * @brief One measured key sequence.
 *
 * When totalSequenceTime is absent the total is approximated by the sum of
 * the letter reaction times, missing ones counting as 0.
 */
struct TimingRecord {
    std::string sequence;
    std::optional<std::vector<LetterTiming>> letterTimings;
    std::optional<double> totalSequenceTime;

    TimingRecord() = default;
    TimingRecord(std::string seq, std::optional<double> total)
        : sequence(std::move(seq)), totalSequenceTime(total) {}
};

struct TimingAggregation {
    NgramTimings timings;
    size_t usedRecords = 0;
    size_t skippedRecords = 0;
};

/**
 * @brief Averages records per sequence into uni/bi/tri timing tables.
 *
 * Records with an empty sequence, a sequence longer than 3 keys, or a
 * non-finite/negative time are skipped and counted, never fatal.
 */
TimingAggregation aggregateTimingRecords(const std::vector<TimingRecord>& records);

/**
 * @brief Knobs of the synthetic timing generator (milliseconds).
 *
 * Rows are numbered top to bottom: 0 numbers, 1 top letters, 2 home, 3 bottom.
 */
struct SyntheticTimingModel {
    double rowBaseNumbers = 220.0;
    double rowBaseTop = 170.0;
    double rowBaseHome = 140.0;
    double rowBaseBottom = 200.0;
    double distancePenalty = 4.0;
    double sameRowPenalty = 12.0;
    double diffRowPenalty = 6.0;
    double repeatPenalty = 35.0;
    double noiseStd = 0.0;

    // Home-row columns of the two index-finger rest keys (f and j)
    size_t homeRow = 2;
    size_t leftHomeColumn = 3;
    size_t rightHomeColumn = 6;

    void validate() const;
};

/**
 * @brief Synthetic measurements: one record per key and per ordered key pair.
 *
 * Times grow with row, distance from the home keys, edge (pinky) position,
 * same-hand travel and vertical/lateral movement. Deterministic for a seed.
 */
std::vector<TimingRecord> generateSyntheticRecords(const KeySpace& keySpace,
                                                   const SyntheticTimingModel& model,
                                                   std::uint64_t seed);
