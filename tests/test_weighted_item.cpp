#include <catch2/catch_test_macros.hpp>
#include "wrsel/selector/selector_options.hpp"
#include "wrsel/selector/weighted_item.hpp"
#include <string>

using namespace wrsel::selector;

TEST_CASE("WeightedItem exposes value and weight", "[item]") {
    WeightedItem<std::string> item("lorem", 5.0);
    REQUIRE(item.value() == "lorem");
    REQUIRE(item.weight() == 5.0);
}

TEST_CASE("WeightedItem structured binding", "[item]") {
    WeightedItem<std::string> item("lorem", 5.0);
    auto [name, weight] = item;
    REQUIRE(name == item.value());
    REQUIRE(weight == item.weight());
}

TEST_CASE("WeightedItem equality compares value and weight", "[item]") {
    WeightedItem<int> a(1, 2.5);
    REQUIRE(a == WeightedItem<int>(1, 2.5));
    REQUIRE_FALSE(a == WeightedItem<int>(1, 3.0));
    REQUIRE_FALSE(a == WeightedItem<int>(2, 2.5));
}

TEST_CASE("SelectorOptions combine as flags", "[options]") {
    constexpr auto both = SelectorOptions::AllowDuplicates | SelectorOptions::IgnoreZeroWeight;
    static_assert(both == DEFAULT_OPTIONS);
    static_assert(has_option(both, SelectorOptions::AllowDuplicates));
    static_assert(has_option(both, SelectorOptions::IgnoreZeroWeight));
    static_assert(!has_option(SelectorOptions::None, SelectorOptions::AllowDuplicates));

    auto opts = SelectorOptions::None;
    opts |= SelectorOptions::IgnoreZeroWeight;
    REQUIRE(has_option(opts, SelectorOptions::IgnoreZeroWeight));
    REQUIRE_FALSE(has_option(opts, SelectorOptions::AllowDuplicates));
}
