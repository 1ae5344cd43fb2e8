#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace securewallet {

// A paired remote wallet reached over a JSON-RPC style channel. The remote side
// holds the key and may broadcast on its own. Transport failures throw
// WalletError(BackendUnavailable); a refusal by the remote user throws
// WalletError(Cancelled).
class PairingSession {
public:
    virtual ~PairingSession() = default;

    virtual nlohmann::json request(const std::string& method, const nlohmann::json& params) = 0;
    virtual void disconnect() = 0;
};

} // namespace securewallet
