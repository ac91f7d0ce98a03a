#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>

namespace extraction_eval {

/// Additive unit of evaluation.
struct Count {
    size_t true_positives = 0;
    size_t false_positives = 0;
    size_t false_negatives = 0;
    // Boolean fields only; never enters precision or recall
    size_t true_negatives = 0;

    Count& operator+=(const Count& other)
    {
        true_positives += other.true_positives;
        false_positives += other.false_positives;
        false_negatives += other.false_negatives;
        true_negatives += other.true_negatives;
        return *this;
    }

    static Count tp() { return { 1, 0, 0, 0 }; }
    static Count fp() { return { 0, 1, 0, 0 }; }
    static Count fn() { return { 0, 0, 1, 0 }; }
    static Count tn() { return { 0, 0, 0, 1 }; }
    // A wrong value is both an incorrect output and a missed correct one
    static Count mismatch() { return { 0, 1, 1, 0 }; }
};

inline Count operator+(Count a, const Count& b)
{
    a += b;
    return a;
}

inline bool operator==(const Count& a, const Count& b)
{
    return a.true_positives == b.true_positives
        && a.false_positives == b.false_positives
        && a.false_negatives == b.false_negatives
        && a.true_negatives == b.true_negatives;
}

/// Precision, recall and F1 derived from a Count.
struct Metrics {
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    Count count;
};

/// Each ratio is 0 when its denominator is 0.
Metrics calculate_metrics(const Count& count);

/// {precision, recall, f1, tp, fp, fn, tn}
void to_json(nlohmann::json& j, const Metrics& m);

/// Reads tp/fp/fn/tn back and re-derives the ratios.
void from_json(const nlohmann::json& j, Metrics& m);

} // namespace extraction_eval
