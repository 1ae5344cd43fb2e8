#pragma once

#include <memory>
#include <mutex>
#include "pairing_session.hpp"
#include "signer.hpp"

namespace securewallet {

// Backend that forwards requests to a paired remote wallet. The remote wallet
// signs and broadcasts on its own, so sign() only yields the hash it reports.
class ExternalSigner : public Signer {
public:
    ExternalSigner() = default;

    void attach(std::shared_ptr<PairingSession> session);
    void detach();
    bool has_session() const;

    BackendKind kind() const override { return BackendKind::External; }
    bool is_available() override { return has_session(); }
    std::optional<Account> locate() override;

    // Pairing happens outside the wallet; this only reports the paired account
    Account create(bool require_biometric) override;

    SignOutcome sign(const UnsignedTransaction& tx) override;
    std::string sign_message(const std::string& message) override;
    void remove() override;

private:
    std::shared_ptr<PairingSession> session() const;

    mutable std::mutex mu_;
    std::shared_ptr<PairingSession> session_;
};

} // namespace securewallet
