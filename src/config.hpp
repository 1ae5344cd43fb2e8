#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "consts.hpp"

namespace securewallet {

struct WalletConfig {
    std::string rpc_url = DEFAULT_RPC_URL;
    uint64_t chain_id = DEFAULT_CHAIN_ID;
    std::string max_send_amount = DEFAULT_MAX_SEND_AMOUNT;
    uint32_t hardware_timeout_ms = DEFAULT_HARDWARE_TIMEOUT_MS;
    std::string key_store_path = "securewallet_keys.json";
    uint32_t confirmations = DEFAULT_CONFIRMATIONS;
    uint32_t confirmation_poll_ms = DEFAULT_CONFIRMATION_POLL_MS;
    std::string log_level = "info";
    std::string log_file;

    // Not read from the file; only SECUREWALLET_PASSPHRASE sets it
    std::string passphrase;

    // Defaults for a missing file. Throws WalletError(ConfigError) for a file
    // that can't be read or parsed, or holds values of the wrong type
    static WalletConfig load(const std::string& path);

    // Parses a JSON document. Unknown keys are ignored, missing keys keep defaults
    static WalletConfig from_json_text(const std::string& text);

    // SECUREWALLET_RPC_URL and SECUREWALLET_PASSPHRASE
    void apply_environment();

    // Throws WalletError(ConfigError) for values that can't work
    void validate() const;
};

void to_json(nlohmann::json& j, const WalletConfig& config);
void from_json(const nlohmann::json& j, WalletConfig& config);

} // namespace securewallet
