#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "address.hpp"
#include "uint256.hpp"

namespace securewallet {

struct FeeData {
    Uint256 gas_price;
};

// Parameters of an eth_estimateGas call
struct GasQuery {
    Address from;
    Address to;
    Uint256 value;
    std::vector<uint8_t> data;
};

// Access to a chain node. Query failures throw WalletError(RpcError);
// estimate_gas throws GasEstimationFailed; broadcast throws NonceConflict when
// the node rejects the nonce and BroadcastRejected for any other rejection.
class ChainRpc {
public:
    virtual ~ChainRpc() = default;

    // Pending-state transaction count of the address
    virtual uint64_t get_nonce(const Address& address) = 0;
    virtual FeeData get_fee_data() = 0;
    virtual uint64_t estimate_gas(const GasQuery& query) = 0;

    // Submits raw signed bytes, returns the transaction hash ("0x...")
    virtual std::string broadcast(const std::vector<uint8_t>& raw_transaction) = 0;

    virtual Uint256 get_balance(const Address& address) = 0;
    virtual uint64_t get_chain_id() = 0;
    virtual uint64_t get_block_number() = 0;

    // Block that included the transaction, nullopt while it is pending or unknown
    virtual std::optional<uint64_t> get_transaction_block(const std::string& tx_hash) = 0;
};

} // namespace securewallet
