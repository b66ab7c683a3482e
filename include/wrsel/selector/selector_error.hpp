#pragma once

#include <string>

namespace wrsel::selector {

enum class SelectorError {
    EmptyCollection,
    InvalidWeight,
    InvalidCount,
    InsufficientItems,
};

[[nodiscard]] std::string selector_error_message(SelectorError err);

}  // namespace wrsel::selector
