#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>
#include "wrsel/common/drbg.hpp"
#include "wrsel/selector/selector_error.hpp"

namespace wrsel::selector {

constexpr int DEFAULT_DECIMAL_PLACES = 2;
constexpr int MAX_DECIMAL_PLACES = 9;

// Largest scaled weight a single item may carry (2^53, exact in a double)
constexpr int64_t MAX_SCALED_WEIGHT = int64_t{1} << 53;

// 10^decimal_places. Throws std::invalid_argument outside [0, MAX_DECIMAL_PLACES].
int64_t scale_factor(int decimal_places);

// weight * factor truncated toward zero. Digits past the factor's precision
// are dropped. Returns nullopt for non-finite, negative or oversized results.
std::optional<int64_t> scale_weight(double weight, int64_t factor);

struct CumulativeIndex {
    // cumulative[i] = sum of scaled weights 0..=i, non-decreasing
    std::vector<int64_t> cumulative;
    int64_t total = 0;
};

// Scales each weight and folds it into a running sum.
// Weights must be accepted by scale_weight; throws std::overflow_error if the
// running sum leaves the int64_t range.
CumulativeIndex build_cumulative(std::span<const double> weights, int64_t factor);

// Smallest index whose cumulative value is >= roll, clamped to the last
// index. cumulative must be non-empty.
size_t find_index(std::span<const int64_t> cumulative, int64_t roll);

// Uniform draw in [1, total]. Requires total > 0.
int64_t roll(int64_t total, common::HashDrbg& drbg);

// One weighted draw over a cumulative array.
// A single entry is returned without drawing; a zero total falls back to a
// uniform pick among the entries.
[[nodiscard]] std::expected<size_t, SelectorError>
select_index(std::span<const int64_t> cumulative, int64_t total, common::HashDrbg& drbg);

// Removes entry `index` and shifts every later entry down by the removed
// item's scaled weight, so the list stays the cumulative array of the
// remaining items.
void erase_entry(std::vector<int64_t>& cumulative, size_t index);

}  // namespace wrsel::selector
