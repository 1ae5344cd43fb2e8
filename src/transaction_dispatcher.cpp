#include "transaction_dispatcher.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logger.hpp"
#include <thread>

namespace securewallet {

const char* dispatch_state_name(DispatchState state) {
    switch (state) {
        case DispatchState::Building: return "Building";
        case DispatchState::Signing: return "Signing";
        case DispatchState::Broadcasting: return "Broadcasting";
        case DispatchState::Confirmed: return "Confirmed";
        case DispatchState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string FeeEstimate::total() const {
    return total_wei.format_units(ETHER_DECIMALS);
}

TransactionDispatcher::TransactionDispatcher(std::shared_ptr<ChainRpc> rpc,
                                             TransactionBuilder builder,
                                             uint64_t chain_id,
                                             std::shared_ptr<SigningLockRegistry> locks)
    : rpc_(std::move(rpc))
    , builder_(std::move(builder))
    , chain_id_(chain_id)
    , locks_(std::move(locks)) {
    if (!rpc_ || !locks_) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "TransactionDispatcher requires an RPC and a lock registry");
    }
}

void TransactionDispatcher::transition(DispatchState state, const std::string& detail, const CancellationToken* cancel) {
    bool before_broadcast = state == DispatchState::Building ||
                            state == DispatchState::Signing ||
                            state == DispatchState::Broadcasting;
    if (before_broadcast && cancel && cancel->is_cancelled()) {
        LOG_INFO << "Send cancelled before " << dispatch_state_name(state);
        throw WalletError(WalletError::ErrorType::Cancelled, "Send cancelled");
    }

    LOG_INFO << "dispatch: " << dispatch_state_name(state) << (detail.empty() ? "" : " " + detail);
    if (observer_) {
        observer_(state, detail);
    }
}

uint64_t TransactionDispatcher::estimate_gas(const Address& from, const Address& to, const Uint256& value) {
    GasQuery query{.from = from, .to = to, .value = value, .data = {}};
    try {
        return rpc_->estimate_gas(query);
    } catch (const WalletError& e) {
        if (e.type() == WalletError::ErrorType::GasEstimationFailed) {
            throw;
        }
        throw WalletError(WalletError::ErrorType::GasEstimationFailed, e.what());
    }
}

SendResult TransactionDispatcher::attempt(Signer& signer,
                                          const Account& from,
                                          const std::string& to,
                                          const std::string& amount,
                                          const CancellationToken* cancel,
                                          int attempt_number) {
    transition(DispatchState::Building, "attempt " + std::to_string(attempt_number), cancel);

    Address recipient = builder_.parse_recipient(to);
    Uint256 value = builder_.parse_amount(amount);

    FeeData fee = rpc_->get_fee_data();
    uint64_t gas_limit = estimate_gas(from.address, recipient, value);
    // Last network read before hashing
    uint64_t nonce = rpc_->get_nonce(from.address);

    UnsignedTransaction tx = builder_.build(to, amount, nonce, fee.gas_price, gas_limit, chain_id_);
    LOG_DEBUG << "Built transaction nonce=" << nonce << " gas=" << gas_limit
              << " gasPrice=" << fee.gas_price.to_decimal() << " value=" << value.to_decimal();

    transition(DispatchState::Signing, backend_name(signer.kind()), cancel);
    SignOutcome outcome = signer.sign(tx);

    if (auto* submission = std::get_if<ExternalSubmission>(&outcome)) {
        transition(DispatchState::Confirmed, submission->tx_hash, nullptr);
        return SendResult{.tx_hash = submission->tx_hash, .nonce = nonce,
                          .attempts = attempt_number, .broadcast_locally = false};
    }

    const auto& signed_tx = std::get<SignedTransaction>(outcome);
    auto raw = signed_tx.serialize();

    Address sender = SignedTransaction::decode(raw).recover_sender();
    if (sender != from.address) {
        LOG_ERROR << "Signed transaction recovers to " << sender.to_checksum_string()
                  << " but the active account is " << from.address.to_checksum_string();
        throw WalletError(WalletError::ErrorType::SignatureVerificationFailed,
            "Signature belongs to " + sender.to_checksum_string() + ", not the active account");
    }

    transition(DispatchState::Broadcasting, HexUtils::encode_prefixed(signed_tx.hash()), cancel);
    std::string tx_hash = rpc_->broadcast(raw);

    transition(DispatchState::Confirmed, tx_hash, nullptr);
    return SendResult{.tx_hash = tx_hash, .nonce = nonce, .attempts = attempt_number, .broadcast_locally = true};
}

SendResult TransactionDispatcher::send(Signer& signer,
                                       const Account& from,
                                       const std::string& to,
                                       const std::string& amount,
                                       const CancellationToken* cancel) {
    auto lock = locks_->acquire(from.address);

    for (int attempt_number = 1; ; ++attempt_number) {
        try {
            return attempt(signer, from, to, amount, cancel, attempt_number);
        } catch (const WalletError& e) {
            if (e.type() == WalletError::ErrorType::NonceConflict && attempt_number < MAX_ATTEMPTS) {
                LOG_WARN << "Nonce conflict, rebuilding: " << e.what();
                continue;
            }

            std::string detail = std::string(WalletError::type_name(e.type())) + ": " + e.what();
            if (observer_) {
                observer_(DispatchState::Failed, detail);
            }
            LOG_ERROR << "dispatch: Failed " << detail;

            if (e.type() == WalletError::ErrorType::NonceConflict) {
                throw WalletError(WalletError::ErrorType::BroadcastRejected,
                    "Nonce conflict persisted after retry: " + std::string(e.what()));
            }
            throw;
        }
    }
}

void TransactionDispatcher::validate(const std::string& to, const std::string& amount) const {
    builder_.parse_recipient(to);
    builder_.parse_amount(amount);
}

FeeEstimate TransactionDispatcher::estimate_fee(const Account& from, const std::string& to, const std::string& amount) {
    Address recipient = builder_.parse_recipient(to);
    Uint256 value = builder_.parse_amount(amount);

    FeeEstimate estimate;
    estimate.gas_price = rpc_->get_fee_data().gas_price;
    estimate.gas_limit = estimate_gas(from.address, recipient, value);
    estimate.total_wei = estimate.gas_price * Uint256(estimate.gas_limit);
    return estimate;
}

bool TransactionDispatcher::await_confirmations(const std::string& tx_hash,
                                                uint32_t confirmations,
                                                std::chrono::milliseconds poll_interval,
                                                uint32_t max_polls) {
    for (uint32_t poll = 0; poll < max_polls; ++poll) {
        if (poll > 0) {
            std::this_thread::sleep_for(poll_interval);
        }
        try {
            auto block = rpc_->get_transaction_block(tx_hash);
            if (block) {
                uint64_t head = rpc_->get_block_number();
                uint64_t depth = head >= *block ? head - *block + 1 : 0;
                LOG_DEBUG << tx_hash << " has " << depth << " confirmation(s)";
                if (depth >= confirmations) {
                    return true;
                }
            }
        } catch (const WalletError& e) {
            LOG_WARN << "Confirmation poll failed: " << e.what();
        }
    }
    LOG_WARN << tx_hash << " not confirmed after " << max_polls << " polls";
    return false;
}

} // namespace securewallet
