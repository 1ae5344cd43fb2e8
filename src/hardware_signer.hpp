#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include "error.hpp"
#include "secure_element.hpp"
#include "signer.hpp"

namespace securewallet {

// Backend over a secure element that can only sign digests.
//
// The address is never taken from key generation or a cache: the module is
// known to occasionally switch the key it signs with, so locate() asks it to
// sign a throwaway probe digest and derives the address from the public key
// that came back with that signature. Transactions go through the
// SignatureReconciler, which repairs the recovery identifier and rejects any
// signature that does not recover to the reported key.
class HardwareSigner : public Signer {
public:
    HardwareSigner(std::shared_ptr<SecureElement> element, std::chrono::milliseconds timeout);

    BackendKind kind() const override { return BackendKind::Hardware; }
    bool is_available() override;
    std::optional<Account> locate() override;
    Account create(bool require_biometric) override;
    SignOutcome sign(const UnsignedTransaction& tx) override;
    std::string sign_message(const std::string& message) override;
    void remove() override;

    // keccak256(0x1234567890abcdef)
    static Hash256 probe_hash();

private:
    Account probe();

    // One sign_hash round trip bounded by timeout_. The call runs on a detached
    // worker that owns a reference to the element, so an expired call can
    // still finish safely in the background. Round trips are serialized: while
    // an earlier one (expired or not) is still inside the module, a new caller
    // waits up to timeout_ and then gives up without starting another worker.
    SignaturePayload timed_sign(const Hash256& hash);

    // Shared with the workers; busy while a sign_hash call is in the module
    struct RoundTripGate {
        std::mutex mu;
        std::condition_variable idle;
        bool busy = false;
    };

    std::shared_ptr<SecureElement> element_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<RoundTripGate> gate_ = std::make_shared<RoundTripGate>();
};

} // namespace securewallet
