// ============================================================================
// Frequency Analysis: Record Set + Empirical Probabilities
// File: record_set.hpp
// ============================================================================
//
// Purpose:
// - Hold the observed flood magnitudes and (optionally) one batch of
//   historical floods, sorted descending.
// - Partition the sorted records into
//     extreme  : prefix, ranked against the whole survey period
//     ordinary : suffix, the continuously observed records
// - Assign empirical exceedance probabilities (Weibull plotting positions)
//   per partition, or take caller overrides.
//
// Probability formulas (0-based ranks, N = period length):
//   no extreme records : p_i = (i+1)/(N+1)
//   extreme rank i     : p_i = (i+1)/(N+1)
//   ordinary rank j    : p_j = pe + (1-pe)*(j+1)/(n_ord+1)
//                        pe = probability of the last extreme record
//
// Notes:
// - attach_historical() always recomputes from the observed data: a second
//   call replaces the first batch.
// - The probability source is an explicit variant; overrides are never
//   silently mixed with the derived formulas.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace floodfreq::freq {

// Probabilities computed from ranks on demand.
struct DerivedProbabilities final {};

// Caller-supplied probabilities, one per record in descending-value order.
struct OverriddenProbabilities final {
    std::vector<double> values;
};

using ProbabilitySource = std::variant<DerivedProbabilities, OverriddenProbabilities>;

class RecordSet final {
public:
    // Throws ValidationError on empty or non-finite input.
    explicit RecordSet(std::vector<double> observed);

    // Replace the historical batch and re-partition.
    // extreme_count defaults to historical.size().
    void attach_historical(const std::vector<double>& historical,
                           int period_length,
                           std::optional<int> extreme_count = std::nullopt);

    // Accessors
    const std::vector<double>& observed() const noexcept { return observed_; }
    const std::vector<double>& historical() const noexcept { return historical_; }
    const std::vector<double>& values() const noexcept { return sorted_; }
    std::vector<double> extreme_values() const;
    std::vector<double> ordinary_values() const;

    std::size_t size() const noexcept { return sorted_.size(); }
    std::size_t extreme_count() const noexcept { return extreme_count_; }
    std::size_t ordinary_count() const noexcept { return sorted_.size() - extreme_count_; }
    bool has_extreme() const noexcept { return extreme_count_ > 0; }
    int period_length() const noexcept { return period_length_; }

    // Empirical exceedance probabilities (same order as values()).
    std::vector<double> empirical_probabilities() const;
    std::vector<double> extreme_probabilities() const;
    std::vector<double> ordinary_probabilities() const;

    // Overrides
    void set_probabilities(std::vector<double> probabilities);
    void set_probability_at_rank(int rank, double probability, int start = 1);
    void reset_probabilities() noexcept;

    bool probabilities_overridden() const noexcept;
    const ProbabilitySource& probability_source() const noexcept { return source_; }

private:
    std::vector<double> derived_extreme_() const;
    std::vector<double> derived_ordinary_() const;

private:
    std::vector<double> observed_;
    std::vector<double> historical_;
    std::vector<double> sorted_;
    std::size_t extreme_count_ = 0;
    int period_length_ = 0;
    ProbabilitySource source_{DerivedProbabilities{}};
};

} // namespace floodfreq::freq
