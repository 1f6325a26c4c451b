#include "secure_store.hpp"
#include <fmt/format.h>

std::string SecureStore::describe(StoreStatus status) const {
    switch (status) {
        case STATUS_SUCCESS:        return "No error.";
        case STATUS_IO:             return "I/O error.";
        case STATUS_PARAM:          return "One or more parameters passed to a function were not valid.";
        case STATUS_NOT_AVAILABLE:  return "The secure store is not available.";
        case STATUS_DUPLICATE_ITEM: return "The specified item already exists in the store.";
        case STATUS_ITEM_NOT_FOUND: return "The specified item could not be found in the store.";
        case STATUS_DECODE:         return "Unable to decode the provided data.";
    }
    return fmt::format("Unknown status {}.", status);
}
