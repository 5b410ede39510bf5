#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <nlohmann/json.hpp>
#include "error.hpp"

namespace bitcli {

// Reads an amount, index or fee rate from an explorer object. nlohmann
// converts negative, boolean and fractional numbers into unsigned targets
// without complaint, so anything but a JSON unsigned integer that fits T is
// a DecodeError. A missing field still throws json::out_of_range.
template<typename T>
T unsigned_value(const nlohmann::json& value, const std::string& name) {
    static_assert(std::numeric_limits<T>::is_integer && !std::numeric_limits<T>::is_signed);
    if (!value.is_number_unsigned()) {
        throw WalletError(WalletError::ErrorType::DecodeError,
            "Field " + name + " must be a non-negative integer, got " + value.dump());
    }
    const auto raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw WalletError(WalletError::ErrorType::DecodeError,
            "Field " + name + " is out of range: " + value.dump());
    }
    return static_cast<T>(raw);
}

template<typename T>
T unsigned_field(const nlohmann::json& object, const char* name) {
    return unsigned_value<T>(object.at(name), name);
}

} // namespace bitcli
