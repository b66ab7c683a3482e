#include "wrsel/selector/selector_error.hpp"

namespace wrsel::selector {

std::string selector_error_message(SelectorError err) {
    switch (err) {
        case SelectorError::EmptyCollection: return "There are no items to select from";
        case SelectorError::InvalidWeight: return "Weight must be a finite number > 0";
        case SelectorError::InvalidCount: return "Count must be > 0";
        case SelectorError::InsufficientItems: return "Not enough items to select without duplicates";
        default: return "Unknown selector error";
    }
}

}  // namespace wrsel::selector
