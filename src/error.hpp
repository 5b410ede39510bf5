#pragma once

#include <stdexcept>
#include <string>

namespace bitcli {

class WalletError : public std::runtime_error {
public:
    enum class ErrorType {
        NetworkError,
        DecodeError,
        UnsupportedNetwork,
        InvalidAddress,
        InsufficientFunds,
        BroadcastError,
        InternalSigningError,
        KeyDerivationError,
        StorageError,
        ConfigError
    };

    WalletError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? type_name(type) : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

    // Stable name of an error kind, used by the command line front end
    static const char* type_name(ErrorType type) {
        switch (type) {
            case ErrorType::NetworkError: return "NetworkError";
            case ErrorType::DecodeError: return "DecodeError";
            case ErrorType::UnsupportedNetwork: return "UnsupportedNetwork";
            case ErrorType::InvalidAddress: return "InvalidAddress";
            case ErrorType::InsufficientFunds: return "InsufficientFunds";
            case ErrorType::BroadcastError: return "BroadcastError";
            case ErrorType::InternalSigningError: return "InternalSigningError";
            case ErrorType::KeyDerivationError: return "KeyDerivationError";
            case ErrorType::StorageError: return "StorageError";
            case ErrorType::ConfigError: return "ConfigError";
        }
        return "WalletError";
    }

private:
    ErrorType type_;
};

} // namespace bitcli
