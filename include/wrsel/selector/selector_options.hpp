#pragma once

#include <cstdint>

namespace wrsel::selector {

enum class SelectorOptions : uint8_t {
    None = 0,
    // A value may be drawn more than once by select_many
    AllowDuplicates = 1 << 0,
    // Items with weight <= 0 are dropped on add instead of rejected
    IgnoreZeroWeight = 1 << 1,
};

constexpr SelectorOptions operator|(SelectorOptions a, SelectorOptions b) {
    return static_cast<SelectorOptions>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr SelectorOptions operator&(SelectorOptions a, SelectorOptions b) {
    return static_cast<SelectorOptions>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

constexpr SelectorOptions& operator|=(SelectorOptions& a, SelectorOptions b) {
    return a = a | b;
}

constexpr bool has_option(SelectorOptions set, SelectorOptions flag) {
    return (set & flag) == flag;
}

constexpr SelectorOptions DEFAULT_OPTIONS =
    SelectorOptions::AllowDuplicates | SelectorOptions::IgnoreZeroWeight;

}  // namespace wrsel::selector
