#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <numeric>
#include <ranges>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "wrsel/common/drbg.hpp"
#include "wrsel/selector/cumulative_weights.hpp"
#include "wrsel/selector/selector_error.hpp"
#include "wrsel/selector/selector_options.hpp"
#include "wrsel/selector/weighted_item.hpp"

namespace wrsel::selector {

enum class CacheState {
    Clean,
    Dirty,
};

// Weighted random selection over an ordered item sequence.
//
// Weights are scaled by 10^decimal_places and truncated to integers; draws
// bisect the cumulative array of those integers. The cumulative index is
// rebuilt lazily, only when a selection runs after a mutation.
//
// Not thread-safe: the cache and the DRBG are mutated by selections.
template<typename T>
class WeightedSelector {
public:
    using Item = WeightedItem<T>;

    explicit WeightedSelector(SelectorOptions options = DEFAULT_OPTIONS,
                              int decimal_places = DEFAULT_DECIMAL_PLACES)
        : options_(options),
          decimal_places_(decimal_places),
          factor_(selector::scale_factor(decimal_places)) {}

    // Deterministic: identical seeds and calls give identical draws
    WeightedSelector(SelectorOptions options, int decimal_places, const common::DrbgSeed& seed)
        : options_(options),
          decimal_places_(decimal_places),
          factor_(selector::scale_factor(decimal_places)),
          drbg_(seed) {}

    // Adopts items through add(); throws std::invalid_argument on a rejected item
    explicit WeightedSelector(std::vector<Item> items,
                              SelectorOptions options = DEFAULT_OPTIONS,
                              int decimal_places = DEFAULT_DECIMAL_PLACES)
        : WeightedSelector(options, decimal_places) {
        adopt(std::move(items));
    }

    WeightedSelector(std::vector<Item> items, SelectorOptions options, int decimal_places,
                     const common::DrbgSeed& seed)
        : WeightedSelector(options, decimal_places, seed) {
        adopt(std::move(items));
    }

    [[nodiscard]] std::expected<void, SelectorError> add(Item item) {
        // NaN and both infinities are refused whatever the options say
        if (!std::isfinite(item.weight())) {
            return std::unexpected(SelectorError::InvalidWeight);
        }
        if (item.weight() <= 0.0) {
            if (has_option(options_, SelectorOptions::IgnoreZeroWeight)) {
                spdlog::debug("wrsel: dropping item with non-positive weight {}", item.weight());
                return {};
            }
            return std::unexpected(SelectorError::InvalidWeight);
        }
        auto scaled = scale_weight(item.weight(), factor_);
        if (!scaled) {
            return std::unexpected(SelectorError::InvalidWeight);
        }
        // The cumulative index must stay within int64_t
        if (*scaled > std::numeric_limits<int64_t>::max() - scaled_total_) {
            return std::unexpected(SelectorError::InvalidWeight);
        }

        scaled_total_ += *scaled;
        items_.push_back(std::move(item));
        state_ = CacheState::Dirty;
        return {};
    }

    [[nodiscard]] std::expected<void, SelectorError> add(T value, double weight) {
        return add(Item(std::move(value), weight));
    }

    // Stops at the first rejected item; earlier items stay added.
    template<std::ranges::input_range R>
    [[nodiscard]] std::expected<void, SelectorError> add_many(R&& items) {
        for (auto&& item : items) {
            auto result = add(Item(item));
            if (!result) return result;
        }
        return {};
    }

    // Removes the first item equal in value and weight. Always invalidates
    // the cumulative index.
    bool remove(const Item& item) {
        state_ = CacheState::Dirty;
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (*it == item) {
                scaled_total_ -= scale_weight(it->weight(), factor_).value_or(0);
                items_.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() {
        items_.clear();
        scaled_total_ = 0;
        state_ = CacheState::Dirty;
    }

    // Recomputes the cumulative index if anything changed since the last build
    void build() {
        if (state_ == CacheState::Clean) return;

        std::vector<double> weights;
        weights.reserve(items_.size());
        for (const auto& item : items_) weights.push_back(item.weight());

        index_ = build_cumulative(weights, factor_);

        // Only no-duplicate multi-select consumes the mutable copy
        if (!has_option(options_, SelectorOptions::AllowDuplicates)) {
            working_cumulative_ = index_.cumulative;
        } else {
            working_cumulative_.clear();
        }

        state_ = CacheState::Clean;
    }

    [[nodiscard]] std::expected<T, SelectorError> select() {
        if (items_.empty()) return std::unexpected(SelectorError::EmptyCollection);

        build();
        auto index = select_index(index_.cumulative, index_.total, drbg_);
        if (!index) return std::unexpected(index.error());
        return items_[*index].value();
    }

    [[nodiscard]] std::expected<std::vector<T>, SelectorError> select_many(int count) {
        if (count <= 0) return std::unexpected(SelectorError::InvalidCount);
        if (items_.empty()) return std::unexpected(SelectorError::EmptyCollection);

        const bool duplicates = has_option(options_, SelectorOptions::AllowDuplicates);
        if (!duplicates && static_cast<size_t>(count) > items_.size()) {
            return std::unexpected(SelectorError::InsufficientItems);
        }

        build();

        std::vector<T> result;
        result.reserve(static_cast<size_t>(count));

        if (duplicates) {
            for (int i = 0; i < count; ++i) {
                auto index = select_index(index_.cumulative, index_.total, drbg_);
                if (!index) return std::unexpected(index.error());
                result.push_back(items_[*index].value());
            }
            return result;
        }

        // Working copies: positions into items_ and their cumulative weights.
        // The selector's own state is left untouched.
        std::vector<size_t> remaining(items_.size());
        std::iota(remaining.begin(), remaining.end(), size_t{0});
        std::vector<int64_t> weights = working_cumulative_;

        for (int i = 0; i < count && !remaining.empty(); ++i) {
            // Total of what is left, not the cached total
            const int64_t total = weights.back();
            auto index = select_index(weights, total, drbg_);
            if (!index) return std::unexpected(index.error());

            result.push_back(items_[remaining[*index]].value());
            remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(*index));
            erase_entry(weights, *index);
        }
        return result;
    }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    std::span<const Item> items() const { return items_; }

    SelectorOptions options() const { return options_; }
    int decimal_places() const { return decimal_places_; }
    int64_t scale_factor() const { return factor_; }

    CacheState cache_state() const { return state_; }

    // Valid after build(); stale while cache_state() is Dirty
    std::span<const int64_t> cumulative_weights() const { return index_.cumulative; }
    int64_t total_weight() const { return index_.total; }

private:
    void adopt(std::vector<Item> items) {
        items_.reserve(items.size());
        for (auto& item : items) {
            auto result = add(std::move(item));
            if (!result) {
                throw std::invalid_argument(selector_error_message(result.error()));
            }
        }
        state_ = CacheState::Dirty;
    }

    SelectorOptions options_;
    int decimal_places_;
    int64_t factor_;
    common::HashDrbg drbg_;

    std::vector<Item> items_;
    // Sum of the scaled weights of items_
    int64_t scaled_total_ = 0;
    CumulativeIndex index_;
    std::vector<int64_t> working_cumulative_;
    CacheState state_ = CacheState::Dirty;
};

}  // namespace wrsel::selector
