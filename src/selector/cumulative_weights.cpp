#include "wrsel/selector/cumulative_weights.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace wrsel::selector {

int64_t scale_factor(int decimal_places) {
    if (decimal_places < 0 || decimal_places > MAX_DECIMAL_PLACES) {
        throw std::invalid_argument("decimal_places must be in [0, " +
                                    std::to_string(MAX_DECIMAL_PLACES) + "], got " +
                                    std::to_string(decimal_places));
    }
    int64_t factor = 1;
    for (int i = 0; i < decimal_places; ++i) factor *= 10;
    return factor;
}

std::optional<int64_t> scale_weight(double weight, int64_t factor) {
    if (!std::isfinite(weight) || weight < 0.0) return std::nullopt;

    const double scaled = weight * static_cast<double>(factor);
    if (!std::isfinite(scaled) || scaled > static_cast<double>(MAX_SCALED_WEIGHT)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(scaled);
}

CumulativeIndex build_cumulative(std::span<const double> weights, int64_t factor) {
    CumulativeIndex index;
    index.cumulative.reserve(weights.size());

    int64_t running = 0;
    for (double weight : weights) {
        auto scaled = scale_weight(weight, factor);
        if (!scaled) {
            throw std::invalid_argument("weight cannot be scaled: " + std::to_string(weight));
        }
        if (running > std::numeric_limits<int64_t>::max() - *scaled) {
            throw std::overflow_error("cumulative weight exceeds int64_t range");
        }
        running += *scaled;
        index.cumulative.push_back(running);
    }
    index.total = running;

    spdlog::debug("wrsel: built cumulative index of {} entries, total {}",
                  index.cumulative.size(), index.total);
    return index;
}

size_t find_index(std::span<const int64_t> cumulative, int64_t roll) {
    auto it = std::lower_bound(cumulative.begin(), cumulative.end(), roll);
    if (it == cumulative.end()) return cumulative.size() - 1;
    return static_cast<size_t>(it - cumulative.begin());
}

int64_t roll(int64_t total, common::HashDrbg& drbg) {
    return drbg.uniform(1, total);
}

std::expected<size_t, SelectorError>
select_index(std::span<const int64_t> cumulative, int64_t total, common::HashDrbg& drbg) {
    if (cumulative.empty()) return std::unexpected(SelectorError::EmptyCollection);
    if (cumulative.size() == 1) return 0;

    // Every weight truncated to zero: nothing to bisect
    if (total <= 0) {
        return static_cast<size_t>(drbg.uniform(0, static_cast<int64_t>(cumulative.size()) - 1));
    }

    return find_index(cumulative, roll(total, drbg));
}

void erase_entry(std::vector<int64_t>& cumulative, size_t index) {
    if (index >= cumulative.size()) return;

    const int64_t removed = index == 0 ? cumulative[0] : cumulative[index] - cumulative[index - 1];
    cumulative.erase(cumulative.begin() + static_cast<std::ptrdiff_t>(index));
    for (size_t i = index; i < cumulative.size(); ++i) {
        cumulative[i] -= removed;
    }
}

}  // namespace wrsel::selector
