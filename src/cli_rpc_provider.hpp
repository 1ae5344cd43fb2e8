#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "chain_rpc.hpp"

namespace securewallet {

// Output of one shell command, stdout and stderr merged
struct CommandResult {
    int exit_code = 0;
    std::string output;
};

using CommandRunner = std::function<CommandResult(const std::string& command)>;

// ChainRpc over Foundry's `cast rpc` command line tool:
//   cast rpc --rpc-url <url> <method> --raw '<json params>'
// which prints the JSON result of the call. Node error responses make cast
// exit non-zero with the node's message in its output.
class CliRpcProvider : public ChainRpc {
public:
    explicit CliRpcProvider(std::string rpc_url, CommandRunner runner = popen_runner());

    uint64_t get_nonce(const Address& address) override;
    FeeData get_fee_data() override;
    uint64_t estimate_gas(const GasQuery& query) override;
    std::string broadcast(const std::vector<uint8_t>& raw_transaction) override;
    Uint256 get_balance(const Address& address) override;
    uint64_t get_chain_id() override;
    uint64_t get_block_number() override;
    std::optional<uint64_t> get_transaction_block(const std::string& tx_hash) override;

    // Raw JSON-RPC call. Throws WalletError(RpcError) with the tool's output
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    // Runs commands with popen, capturing stderr as well
    static CommandRunner popen_runner();

private:
    std::string rpc_url_;
    CommandRunner runner_;
};

} // namespace securewallet
