#include "TimingData.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <stdexcept>

// -------------------------------------------------------------------------
// Aggregation
// -------------------------------------------------------------------------

namespace {

struct RunningMean {
    double sum = 0.0;
    size_t count = 0;

    void add(double v) { sum += v; count++; }
    double mean() const { return count > 0 ? sum / static_cast<double>(count) : 0.0; }
};

bool recordTotal(const TimingRecord& record, double& total) {
    if (record.totalSequenceTime) {
        total = *record.totalSequenceTime;
    } else {
        total = 0.0;
        if (record.letterTimings) {
            for (const auto& lt : *record.letterTimings) {
                if (lt.reactionTime) total += *lt.reactionTime;
            }
        }
    }
    return std::isfinite(total) && total >= 0.0;
}

} // namespace

TimingAggregation aggregateTimingRecords(const std::vector<TimingRecord>& records) {
    std::map<std::string, RunningMean> perSequence[3];
    TimingAggregation result;

    for (const auto& record : records) {
        size_t n = record.sequence.size();
        double total = 0.0;
        if (n < 1 || n > 3 || !recordTotal(record, total)) {
            result.skippedRecords++;
            continue;
        }
        perSequence[n - 1][record.sequence].add(total);
        result.usedRecords++;
    }

    TimingTable* tables[3] = {&result.timings.unigrams, &result.timings.bigrams, &result.timings.trigrams};
    for (int k = 0; k < 3; ++k) {
        for (const auto& entry : perSequence[k]) {
            (*tables[k])[entry.first] = entry.second.mean();
        }
    }
    return result;
}

// -------------------------------------------------------------------------
// Synthetic generator
// -------------------------------------------------------------------------

void SyntheticTimingModel::validate() const {
    if (noiseStd < 0.0) {
        throw std::invalid_argument("SyntheticTimingModel: noiseStd must be non-negative");
    }
    if (distancePenalty < 0.0) {
        throw std::invalid_argument("SyntheticTimingModel: distancePenalty must be non-negative");
    }
}

namespace {

/**
 * @brief Geometry and timing formulas of the synthetic typist.
 *
 * Rows are staggered: the top letter row sits 1.5 keys left of the home row,
 * the bottom row 2.5 keys left.
 */
class SyntheticTypist {
public:
    SyntheticTypist(const KeySpace& ks, const SyntheticTimingModel& m) : keySpace(ks), model(m) {}

    double unigramTime(size_t idx) const {
        size_t r = keySpace.rowOf(idx);
        double base = rowBase(r);

        double col = adjustedColumn(idx);
        double vertical = std::fabs(static_cast<double>(r) - static_cast<double>(model.homeRow));
        double toLeft = std::hypot(vertical, col - static_cast<double>(model.leftHomeColumn));
        double toRight = std::hypot(vertical, col - static_cast<double>(model.rightHomeColumn));
        double minDist = std::min(toLeft, toRight);

        // Quadratic beyond two keys of travel (pinky territory)
        double penalty;
        if (minDist > 2.0) {
            penalty = 2.0 * model.distancePenalty +
                      (minDist - 2.0) * (minDist - 2.0) * model.distancePenalty * 1.5;
        } else {
            penalty = minDist * model.distancePenalty;
        }

        size_t colInRow = keySpace.columnOf(idx);
        size_t rowSize = keySpace.rowSizes()[r];
        if (colInRow < 2 || colInRow + 2 >= rowSize) {
            penalty += 15.0;
        }

        return std::max(60.0, base + penalty);
    }

    double bigramTime(size_t i1, size_t i2) const {
        double t = unigramTime(i1) + unigramTime(i2);
        if (i1 == i2) {
            t += model.repeatPenalty;
            return std::max(80.0, t);
        }

        size_t r1 = keySpace.rowOf(i1);
        size_t r2 = keySpace.rowOf(i2);
        t += (r1 == r2) ? model.sameRowPenalty : model.diffRowPenalty;

        double c1 = adjustedColumn(i1);
        double c2 = adjustedColumn(i2);
        double vertical = std::fabs(static_cast<double>(r1) - static_cast<double>(r2));
        double horizontal = std::fabs(c1 - c2);
        double distance = std::hypot(vertical, horizontal);
        t += distance * model.distancePenalty;

        const double handSplit = 5.5;
        bool left1 = c1 < handSplit;
        bool left2 = c2 < handSplit;
        if (left1 == left2) {
            t += 30.0 * (distance / 3.0);
        } else {
            t += 4.0;
        }

        if (r1 != r2) {
            // Moving down is slightly worse than moving up
            t += vertical * (r2 < r1 ? 6.0 : 7.5);
        }

        if (horizontal > 2.5) {
            t += (horizontal - 2.5) * 4.5;
        }

        if (vertical > 0.0 && horizontal > 1.5) {
            t += (vertical * horizontal) / 1.5;
        }

        // Deterministic per-pair variation, +/- 11 ms
        double hash = static_cast<double>((i1 * 17 + i2 * 23) % 100) / 100.0;
        t += (hash - 0.5) * 22.0;

        return std::max(80.0, t);
    }

private:
    double rowBase(size_t row) const {
        switch (row) {
            case 1: return model.rowBaseTop;
            case 2: return model.rowBaseHome;
            case 3: return model.rowBaseBottom;
            default: return model.rowBaseNumbers;
        }
    }

    double adjustedColumn(size_t idx) const {
        static const double rowOffset[] = {0.0, -1.5, 0.0, -2.5};
        size_t r = keySpace.rowOf(idx);
        double offset = r < 4 ? rowOffset[r] : 0.0;
        return static_cast<double>(keySpace.columnOf(idx)) + offset;
    }

    const KeySpace& keySpace;
    const SyntheticTimingModel& model;
};

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

std::vector<TimingRecord> generateSyntheticRecords(const KeySpace& keySpace,
                                                   const SyntheticTimingModel& model,
                                                   std::uint64_t seed) {
    model.validate();

    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> smallJitter(-0.15, 0.15);
    std::normal_distribution<double> noise(0.0, model.noiseStd > 0.0 ? model.noiseStd : 1.0);

    auto jitter = [&](double x) {
        double v = x + smallJitter(rng);
        if (model.noiseStd > 0.0) v += noise(rng);
        return v;
    };

    SyntheticTypist typist(keySpace, model);
    const size_t n = keySpace.size();

    std::vector<TimingRecord> records;
    records.reserve(n + n * n);

    for (size_t i = 0; i < n; ++i) {
        std::string sym(1, keySpace.symbolAt(i));
        double t = round2(jitter(typist.unigramTime(i)));

        TimingRecord rec(sym, t);
        rec.letterTimings = std::vector<LetterTiming>{LetterTiming(sym, t)};
        records.push_back(std::move(rec));
    }

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            std::string a(1, keySpace.symbolAt(i));
            std::string b(1, keySpace.symbolAt(j));
            double t = round2(jitter(typist.bigramTime(i, j)));
            double ta = round2(jitter(typist.unigramTime(i)));
            double tb = round2(jitter(typist.unigramTime(j)));

            TimingRecord rec(a + b, t);
            rec.letterTimings = std::vector<LetterTiming>{LetterTiming(a, ta), LetterTiming(b, tb)};
            records.push_back(std::move(rec));
        }
    }

    return records;
}
