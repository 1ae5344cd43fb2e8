#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "chain_rpc.hpp"
#include "external_signer.hpp"
#include "signer.hpp"
#include "transaction_dispatcher.hpp"

namespace securewallet {

// Picks the active account and routes wallet operations to its backend.
//
// Detection runs Hardware, then Software, then External; the first backend
// that locates an account becomes active. Anything that changes which keys
// exist (create, delete, pairing) re-runs detection.
class WalletManager {
public:
    // hardware may be null on devices without a secure element
    WalletManager(std::shared_ptr<Signer> hardware,
                  std::shared_ptr<Signer> software,
                  std::shared_ptr<ExternalSigner> external,
                  std::shared_ptr<ChainRpc> rpc,
                  std::shared_ptr<TransactionDispatcher> dispatcher);

    Account create_wallet(BackendKind kind, bool require_biometric);
    std::optional<Account> get_active_account() const;
    std::optional<Account> refresh();

    // Balance of the active account in whole units
    std::string get_balance();

    // Network fee in whole units
    std::string estimate_fee(const std::string& to, const std::string& amount);

    SendResult send(const std::string& to, const std::string& amount, const CancellationToken* cancel = nullptr);
    std::string sign_message(const std::string& message);
    void delete_active_wallet();

    bool is_hardware_available();
    void attach_external_session(std::shared_ptr<PairingSession> session);
    void detach_external_session();

private:
    Signer& signer_for(BackendKind kind);
    Account require_active() const;

    std::shared_ptr<Signer> hardware_;
    std::shared_ptr<Signer> software_;
    std::shared_ptr<ExternalSigner> external_;
    std::shared_ptr<ChainRpc> rpc_;
    std::shared_ptr<TransactionDispatcher> dispatcher_;

    mutable std::mutex mu_;
    std::optional<Account> active_;
};

} // namespace securewallet
