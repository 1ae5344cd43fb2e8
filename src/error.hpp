#pragma once

#include <stdexcept>
#include <string>

namespace securewallet {

class WalletError : public std::runtime_error {
public:
    enum class ErrorType {
        InvalidInput,
        BackendUnavailable,
        SignerUnavailable,
        SignatureVerificationFailed,
        NonceConflict,
        BroadcastRejected,
        RpcError,
        GasEstimationFailed,
        Cancelled,
        KeyStoreError,
        ConfigError
    };

    WalletError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? default_message(type) : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

    static const char* type_name(ErrorType type) {
        switch (type) {
            case ErrorType::InvalidInput: return "InvalidInput";
            case ErrorType::BackendUnavailable: return "BackendUnavailable";
            case ErrorType::SignerUnavailable: return "SignerUnavailable";
            case ErrorType::SignatureVerificationFailed: return "SignatureVerificationFailed";
            case ErrorType::NonceConflict: return "NonceConflict";
            case ErrorType::BroadcastRejected: return "BroadcastRejected";
            case ErrorType::RpcError: return "RpcError";
            case ErrorType::GasEstimationFailed: return "GasEstimationFailed";
            case ErrorType::Cancelled: return "Cancelled";
            case ErrorType::KeyStoreError: return "KeyStoreError";
            case ErrorType::ConfigError: return "ConfigError";
        }
        return "Unknown";
    }

private:
    static std::string default_message(ErrorType type) {
        return std::string("Wallet error: ") + type_name(type);
    }

    ErrorType type_;
};

} // namespace securewallet
