#include "wallet_manager.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "logger.hpp"

namespace securewallet {

WalletManager::WalletManager(std::shared_ptr<Signer> hardware,
                             std::shared_ptr<Signer> software,
                             std::shared_ptr<ExternalSigner> external,
                             std::shared_ptr<ChainRpc> rpc,
                             std::shared_ptr<TransactionDispatcher> dispatcher)
    : hardware_(std::move(hardware))
    , software_(std::move(software))
    , external_(std::move(external))
    , rpc_(std::move(rpc))
    , dispatcher_(std::move(dispatcher)) {
    if (!software_ || !external_ || !rpc_ || !dispatcher_) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "WalletManager is missing a dependency");
    }
}

Signer& WalletManager::signer_for(BackendKind kind) {
    switch (kind) {
        case BackendKind::Hardware:
            if (!hardware_) {
                throw WalletError(WalletError::ErrorType::BackendUnavailable, "No secure element on this device");
            }
            return *hardware_;
        case BackendKind::Software:
            return *software_;
        case BackendKind::External:
            return *external_;
    }
    throw WalletError(WalletError::ErrorType::InvalidInput, "Unknown backend");
}

std::optional<Account> WalletManager::refresh() {
    std::optional<Account> found;
    for (BackendKind kind : {BackendKind::Hardware, BackendKind::Software, BackendKind::External}) {
        if (kind == BackendKind::Hardware && !hardware_) {
            continue;
        }
        try {
            found = signer_for(kind).locate();
        } catch (const WalletError& e) {
            LOG_WARN << "Detection: " << backend_name(kind) << " backend failed: " << e.what();
            continue;
        }
        if (found) {
            LOG_INFO << "Detection: " << backend_name(kind) << " account " << found->address.to_checksum_string();
            break;
        }
        LOG_DEBUG << "Detection: no " << backend_name(kind) << " account";
    }

    if (!found) {
        LOG_INFO << "Detection: no wallet";
    }

    std::lock_guard<std::mutex> lock(mu_);
    active_ = found;
    return active_;
}

std::optional<Account> WalletManager::get_active_account() const {
    std::lock_guard<std::mutex> lock(mu_);
    return active_;
}

Account WalletManager::require_active() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!active_) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable, "No wallet exists");
    }
    return *active_;
}

Account WalletManager::create_wallet(BackendKind kind, bool require_biometric) {
    Account created = signer_for(kind).create(require_biometric);
    LOG_INFO << "Created " << backend_name(kind) << " wallet " << created.address.to_checksum_string();

    auto active = refresh();
    if (active && active->kind != kind) {
        LOG_WARN << "A " << backend_name(active->kind) << " wallet takes priority over the new "
                 << backend_name(kind) << " wallet";
    }
    return created;
}

std::string WalletManager::get_balance() {
    Account account = require_active();
    Uint256 wei = rpc_->get_balance(account.address);
    std::string balance = wei.format_units(ETHER_DECIMALS);

    std::lock_guard<std::mutex> lock(mu_);
    if (active_ && active_->address == account.address) {
        active_->cached_balance = balance;
    }
    return balance;
}

std::string WalletManager::estimate_fee(const std::string& to, const std::string& amount) {
    Account account = require_active();
    return dispatcher_->estimate_fee(account, to, amount).total();
}

SendResult WalletManager::send(const std::string& to, const std::string& amount, const CancellationToken* cancel) {
    // Bad input must not reach the backend: a hardware re-probe is a module round trip
    dispatcher_->validate(to, amount);
    Account active = require_active();
    Signer& signer = signer_for(active.kind);

    // The hardware module can change keys behind our back; trust only a fresh probe
    auto located = signer.locate();
    if (!located) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable,
            std::string("The ") + backend_name(active.kind) + " wallet is no longer available");
    }
    if (located->address != active.address) {
        LOG_WARN << "Active " << backend_name(active.kind) << " account moved from "
                 << active.address.to_checksum_string() << " to " << located->address.to_checksum_string();
        std::lock_guard<std::mutex> lock(mu_);
        active_ = located;
    }

    return dispatcher_->send(signer, *located, to, amount, cancel);
}

std::string WalletManager::sign_message(const std::string& message) {
    Account active = require_active();
    return signer_for(active.kind).sign_message(message);
}

void WalletManager::delete_active_wallet() {
    Account active = require_active();
    signer_for(active.kind).remove();
    LOG_INFO << "Deleted " << backend_name(active.kind) << " wallet " << active.address.to_checksum_string();
    refresh();
}

bool WalletManager::is_hardware_available() {
    return hardware_ && hardware_->is_available();
}

void WalletManager::attach_external_session(std::shared_ptr<PairingSession> session) {
    external_->attach(std::move(session));
    refresh();
}

void WalletManager::detach_external_session() {
    external_->remove();
    refresh();
}

} // namespace securewallet
