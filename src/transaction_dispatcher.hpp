#pragma once

// =============================================================================
// transaction_dispatcher.hpp: build, sign and broadcast one transfer
// =============================================================================
//
//   Building ──► Signing ──► Broadcasting ──► Confirmed
//      ▲                          │
//      └──── nonce conflict ──────┘  (once; a second conflict is BroadcastRejected)
//
// Any other failure moves to Failed and is rethrown as is. Fee data and the
// gas estimate are fetched first, the nonce last, all while holding the
// sender's signing lock. A transaction is rebuilt and re-signed from scratch
// for the retry.
//
// External backends return a remote hash from Signing and go straight to
// Confirmed; nothing is broadcast locally.
// =============================================================================

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "chain_rpc.hpp"
#include "signer.hpp"
#include "signing_lock.hpp"
#include "transaction_builder.hpp"

namespace securewallet {

enum class DispatchState {
    Building,
    Signing,
    Broadcasting,
    Confirmed,
    Failed
};

const char* dispatch_state_name(DispatchState state);

// Set from any thread; checked before every state up to Broadcasting
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using DispatchObserver = std::function<void(DispatchState state, const std::string& detail)>;

struct SendResult {
    std::string tx_hash;
    uint64_t nonce = 0;
    int attempts = 0;
    bool broadcast_locally = true;
};

struct FeeEstimate {
    uint64_t gas_limit = 0;
    Uint256 gas_price;
    Uint256 total_wei;

    std::string total() const;  // whole units
};

class TransactionDispatcher {
public:
    TransactionDispatcher(std::shared_ptr<ChainRpc> rpc,
                          TransactionBuilder builder,
                          uint64_t chain_id,
                          std::shared_ptr<SigningLockRegistry> locks);

    void set_observer(DispatchObserver observer) { observer_ = std::move(observer); }

    SendResult send(Signer& signer,
                    const Account& from,
                    const std::string& to,
                    const std::string& amount,
                    const CancellationToken* cancel = nullptr);

    // Recipient and amount checks alone, no I/O. Throws WalletError(InvalidInput)
    void validate(const std::string& to, const std::string& amount) const;

    FeeEstimate estimate_fee(const Account& from, const std::string& to, const std::string& amount);

    // Advisory: polls until the transaction has the given number of
    // confirmations or max_polls is reached. Does not throw for RPC errors
    bool await_confirmations(const std::string& tx_hash,
                             uint32_t confirmations,
                             std::chrono::milliseconds poll_interval,
                             uint32_t max_polls);

    static constexpr int MAX_ATTEMPTS = 2;

private:
    void transition(DispatchState state, const std::string& detail, const CancellationToken* cancel);
    uint64_t estimate_gas(const Address& from, const Address& to, const Uint256& value);

    SendResult attempt(Signer& signer,
                       const Account& from,
                       const std::string& to,
                       const std::string& amount,
                       const CancellationToken* cancel,
                       int attempt_number);

    std::shared_ptr<ChainRpc> rpc_;
    TransactionBuilder builder_;
    uint64_t chain_id_;
    std::shared_ptr<SigningLockRegistry> locks_;
    DispatchObserver observer_;
};

} // namespace securewallet
