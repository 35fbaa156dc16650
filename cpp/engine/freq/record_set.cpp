/*
===============================================================================
Frequency Analysis: Record Set + Empirical Probabilities
File: record_set.cpp
===============================================================================
*/

#include "record_set.hpp"

#include "engine/core/logging.hpp"
#include "engine/core/require.hpp"

#include <algorithm>
#include <functional>
#include <sstream>
#include <utility>

namespace floodfreq::freq {

namespace {

void sort_descending(std::vector<double>& v) {
    std::sort(v.begin(), v.end(), std::greater<double>());
}

} // namespace

RecordSet::RecordSet(std::vector<double> observed)
    : observed_(std::move(observed)) {
    FLOODFREQ_REQUIRE(!observed_.empty(), ValidationError, "observed data is empty");
    FLOODFREQ_REQUIRE(all_finite(observed_), ValidationError, "observed data has non-finite values");

    sorted_ = observed_;
    sort_descending(sorted_);
    extreme_count_ = 0;
    period_length_ = static_cast<int>(observed_.size());
}

void RecordSet::attach_historical(const std::vector<double>& historical,
                                  int period_length,
                                  std::optional<int> extreme_count) {
    FLOODFREQ_REQUIRE(all_finite(historical), ValidationError, "historical data has non-finite values");

    const std::size_t total = observed_.size() + historical.size();
    if (period_length < 0 || static_cast<std::size_t>(period_length) < total) {
        std::ostringstream oss;
        oss << "period length " << period_length
            << " is less than observed + historical record count " << total;
        throw ValidationError(site_message(__func__, oss.str()));
    }

    const int n_extreme = extreme_count.value_or(static_cast<int>(historical.size()));
    if (n_extreme < 0 || static_cast<std::size_t>(n_extreme) < historical.size()) {
        std::ostringstream oss;
        oss << "extreme count " << n_extreme
            << " is less than the historical record count " << historical.size();
        throw ValidationError(site_message(__func__, oss.str()));
    }
    FLOODFREQ_REQUIRE(static_cast<std::size_t>(n_extreme) <= total, ValidationError,
                      "extreme count exceeds the number of records");

    if (probabilities_overridden()) {
        log(LogLevel::WARN, "RecordSet",
            "attach_historical discards the probability override");
    }

    historical_ = historical;
    sorted_ = observed_;
    sorted_.insert(sorted_.end(), historical_.begin(), historical_.end());
    sort_descending(sorted_);

    extreme_count_ = static_cast<std::size_t>(n_extreme);
    period_length_ = period_length;
    source_ = DerivedProbabilities{};
}

std::vector<double> RecordSet::extreme_values() const {
    return std::vector<double>(sorted_.begin(),
                               sorted_.begin() + static_cast<std::ptrdiff_t>(extreme_count_));
}

std::vector<double> RecordSet::ordinary_values() const {
    return std::vector<double>(sorted_.begin() + static_cast<std::ptrdiff_t>(extreme_count_),
                               sorted_.end());
}

// -----------------------------
// Derived probabilities
// -----------------------------
std::vector<double> RecordSet::derived_extreme_() const {
    std::vector<double> p;
    p.reserve(extreme_count_);
    const double denom = static_cast<double>(period_length_) + 1.0;
    for (std::size_t i = 0; i < extreme_count_; ++i) {
        p.push_back(static_cast<double>(i + 1) / denom);
    }
    return p;
}

std::vector<double> RecordSet::derived_ordinary_() const {
    const std::size_t n = ordinary_count();
    std::vector<double> p;
    p.reserve(n);

    if (extreme_count_ == 0) {
        // Whole sequence ranked against the survey period.
        const double denom = static_cast<double>(period_length_) + 1.0;
        for (std::size_t j = 0; j < n; ++j) {
            p.push_back(static_cast<double>(j + 1) / denom);
        }
        return p;
    }

    // Rescale into the mass left after the last extreme record.
    const double pe = static_cast<double>(extreme_count_) / (static_cast<double>(period_length_) + 1.0);
    const double denom = static_cast<double>(n) + 1.0;
    for (std::size_t j = 0; j < n; ++j) {
        p.push_back(pe + (1.0 - pe) * static_cast<double>(j + 1) / denom);
    }
    return p;
}

std::vector<double> RecordSet::empirical_probabilities() const {
    if (const auto* ov = std::get_if<OverriddenProbabilities>(&source_)) {
        return ov->values;
    }
    std::vector<double> p = derived_extreme_();
    const std::vector<double> po = derived_ordinary_();
    p.insert(p.end(), po.begin(), po.end());
    return p;
}

std::vector<double> RecordSet::extreme_probabilities() const {
    if (const auto* ov = std::get_if<OverriddenProbabilities>(&source_)) {
        return std::vector<double>(ov->values.begin(),
                                   ov->values.begin() + static_cast<std::ptrdiff_t>(extreme_count_));
    }
    return derived_extreme_();
}

std::vector<double> RecordSet::ordinary_probabilities() const {
    if (const auto* ov = std::get_if<OverriddenProbabilities>(&source_)) {
        return std::vector<double>(ov->values.begin() + static_cast<std::ptrdiff_t>(extreme_count_),
                                   ov->values.end());
    }
    return derived_ordinary_();
}

// -----------------------------
// Overrides
// -----------------------------
void RecordSet::set_probabilities(std::vector<double> probabilities) {
    if (probabilities.size() != sorted_.size()) {
        std::ostringstream oss;
        oss << "expected " << sorted_.size() << " probabilities, got " << probabilities.size();
        throw ValidationError(site_message(__func__, oss.str()));
    }
    for (double p : probabilities) {
        FLOODFREQ_REQUIRE(in_unit_interval(p), ValidationError, "probabilities must lie in [0, 1]");
    }
    source_ = OverriddenProbabilities{std::move(probabilities)};
}

void RecordSet::set_probability_at_rank(int rank, double probability, int start) {
    const long long first = start;
    const long long last = static_cast<long long>(start) + static_cast<long long>(sorted_.size()) - 1;
    if (rank < first || rank > last) {
        std::ostringstream oss;
        oss << "rank " << rank << " outside [" << first << ", " << last << "]";
        throw IndexError(site_message(__func__, oss.str()));
    }
    FLOODFREQ_REQUIRE(in_unit_interval(probability), ValidationError, "probability must lie in [0, 1]");

    std::vector<double> p = empirical_probabilities();
    p[static_cast<std::size_t>(static_cast<long long>(rank) - first)] = probability;
    source_ = OverriddenProbabilities{std::move(p)};
}

void RecordSet::reset_probabilities() noexcept {
    source_ = DerivedProbabilities{};
}

bool RecordSet::probabilities_overridden() const noexcept {
    return std::holds_alternative<OverriddenProbabilities>(source_);
}

} // namespace floodfreq::freq
