#include "cli_rpc_provider.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <memory>
#include <sys/wait.h>

using json = nlohmann::json;

namespace securewallet {

namespace {

// Wraps an argument in single quotes for /bin/sh
std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

const std::string& expect_string(const json& result, const std::string& method) {
    if (!result.is_string()) {
        throw WalletError(WalletError::ErrorType::RpcError,
            method + " returned a non-string result: " + result.dump());
    }
    return result.get_ref<const std::string&>();
}

Uint256 quantity(const json& result, const std::string& method) {
    const std::string& text = expect_string(result, method);
    try {
        return Uint256::from_hex_quantity(text);
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::RpcError,
            method + " returned a malformed quantity '" + text + "': " + e.what());
    }
}

} // anonymous namespace

CommandRunner CliRpcProvider::popen_runner() {
    return [](const std::string& command) {
        std::string full_cmd = command + " 2>&1";  // Capture stderr too

        std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
        if (!pipe) {
            throw WalletError(WalletError::ErrorType::RpcError,
                "Failed to execute cast. Make sure Foundry is installed and in your PATH.");
        }

        CommandResult result;
        std::array<char, 256> buffer;
        while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
            result.output += buffer.data();
        }

        int status = pclose(pipe.release());
        result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        return result;
    };
}

CliRpcProvider::CliRpcProvider(std::string rpc_url, CommandRunner runner)
    : rpc_url_(std::move(rpc_url)), runner_(std::move(runner)) {}

json CliRpcProvider::call(const std::string& method, const json& params) {
    std::string cmd = "cast rpc --rpc-url " + shell_quote(rpc_url_) + " " + shell_quote(method) +
                      " --raw " + shell_quote(params.dump());
    LOG_DEBUG << "rpc> " << method << " " << params.dump();

    CommandResult result = runner_(cmd);
    std::string output = trim(result.output);

    if (result.exit_code != 0) {
        throw WalletError(WalletError::ErrorType::RpcError,
            method + " failed with exit code " + std::to_string(result.exit_code) + ". Output: " + output);
    }
    if (output.empty()) {
        throw WalletError(WalletError::ErrorType::RpcError, "Empty response from " + method);
    }

    try {
        json parsed = json::parse(output);
        LOG_DEBUG << "rpc< " << method << " " << parsed.dump();
        return parsed;
    } catch (const json::exception& e) {
        throw WalletError(WalletError::ErrorType::RpcError,
            "Failed to parse " + method + " response: " + std::string(e.what()) + ". Output: " + output);
    }
}

uint64_t CliRpcProvider::get_nonce(const Address& address) {
    auto result = call("eth_getTransactionCount", json::array({address.to_checksum_string(), "pending"}));
    return quantity(result, "eth_getTransactionCount").to_uint64();
}

FeeData CliRpcProvider::get_fee_data() {
    auto result = call("eth_gasPrice", json::array());
    return FeeData{.gas_price = quantity(result, "eth_gasPrice")};
}

uint64_t CliRpcProvider::estimate_gas(const GasQuery& query) {
    json tx = {
        {"from", query.from.to_checksum_string()},
        {"to", query.to.to_checksum_string()},
        {"value", query.value.to_hex_quantity()}
    };
    if (!query.data.empty()) {
        tx["data"] = HexUtils::encode_prefixed(query.data);
    }

    try {
        auto result = call("eth_estimateGas", json::array({tx}));
        return quantity(result, "eth_estimateGas").to_uint64();
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::GasEstimationFailed, e.what());
    }
}

// The node's rejection text is surfaced verbatim. Any rejection mentioning the
// nonce ("nonce too low", "nonce has already been used", ...) is reported as a
// NonceConflict so the dispatcher can rebuild with a fresh nonce.
std::string CliRpcProvider::broadcast(const std::vector<uint8_t>& raw_transaction) {
    try {
        auto result = call("eth_sendRawTransaction", json::array({HexUtils::encode_prefixed(raw_transaction)}));
        return expect_string(result, "eth_sendRawTransaction");
    } catch (const WalletError& e) {
        std::string message = e.what();
        if (lowercase(message).find("nonce") != std::string::npos) {
            throw WalletError(WalletError::ErrorType::NonceConflict, message);
        }
        throw WalletError(WalletError::ErrorType::BroadcastRejected, message);
    }
}

Uint256 CliRpcProvider::get_balance(const Address& address) {
    auto result = call("eth_getBalance", json::array({address.to_checksum_string(), "latest"}));
    return quantity(result, "eth_getBalance");
}

uint64_t CliRpcProvider::get_chain_id() {
    return quantity(call("eth_chainId", json::array()), "eth_chainId").to_uint64();
}

uint64_t CliRpcProvider::get_block_number() {
    return quantity(call("eth_blockNumber", json::array()), "eth_blockNumber").to_uint64();
}

std::optional<uint64_t> CliRpcProvider::get_transaction_block(const std::string& tx_hash) {
    auto receipt = call("eth_getTransactionReceipt", json::array({tx_hash}));
    if (receipt.is_null()) {
        return std::nullopt;
    }
    if (!receipt.is_object() || !receipt.contains("blockNumber") || receipt["blockNumber"].is_null()) {
        return std::nullopt;
    }
    return quantity(receipt["blockNumber"], "eth_getTransactionReceipt").to_uint64();
}

} // namespace securewallet
