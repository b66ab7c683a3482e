#pragma once

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

namespace wrsel::selector {

// A value paired with its relative selection weight.
template<typename T>
class WeightedItem {
public:
    WeightedItem(T value, double weight)
        : value_(std::move(value)), weight_(weight) {}

    const T& value() const { return value_; }
    double weight() const { return weight_; }

    // Structural equality: value and weight must both match
    friend bool operator==(const WeightedItem&, const WeightedItem&) = default;

    template<size_t I>
    decltype(auto) get() const {
        if constexpr (I == 0) return (value_);
        else return weight_;
    }

private:
    T value_;
    double weight_;
};

}  // namespace wrsel::selector

// auto [value, weight] = item;
template<typename T>
struct std::tuple_size<wrsel::selector::WeightedItem<T>>
    : std::integral_constant<size_t, 2> {};

template<typename T>
struct std::tuple_element<0, wrsel::selector::WeightedItem<T>> {
    using type = const T;
};

template<typename T>
struct std::tuple_element<1, wrsel::selector::WeightedItem<T>> {
    using type = double;
};
