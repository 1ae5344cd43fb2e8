#include "hardware_signer.hpp"
#include "hex_utils.hpp"
#include "logger.hpp"
#include "signature_reconciler.hpp"
#include <system_error>

namespace securewallet {

namespace {

constexpr uint8_t PROBE_BYTES[] = {0x12, 0x34, 0x56, 0x78, 0x90, 0xab, 0xcd, 0xef};

} // anonymous namespace

HardwareSigner::HardwareSigner(std::shared_ptr<SecureElement> element, std::chrono::milliseconds timeout)
    : element_(std::move(element)), timeout_(timeout) {
    if (!element_) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "HardwareSigner requires a secure element");
    }
}

Hash256 HardwareSigner::probe_hash() {
    return HashUtils::keccak256(std::span<const uint8_t>(PROBE_BYTES));
}

bool HardwareSigner::is_available() {
    return element_->is_available();
}

SignaturePayload HardwareSigner::timed_sign(const Hash256& hash) {
    std::shared_ptr<RoundTripGate> gate = gate_;
    {
        std::unique_lock<std::mutex> lock(gate->mu);
        if (!gate->idle.wait_for(lock, timeout_, [&gate] { return !gate->busy; })) {
            LOG_ERROR << "Secure element is still answering an earlier request";
            throw WalletError(WalletError::ErrorType::SignerUnavailable,
                "Secure element is busy with an earlier request that timed out");
        }
        gate->busy = true;
    }

    std::shared_ptr<SecureElement> element = element_;
    std::packaged_task<SignaturePayload()> task([element, gate, hash]() {
        struct Release {
            std::shared_ptr<RoundTripGate> gate;
            ~Release() {
                {
                    std::lock_guard<std::mutex> lock(gate->mu);
                    gate->busy = false;
                }
                gate->idle.notify_all();
            }
        } release{gate};
        return element->sign_hash(hash);
    });
    auto future = task.get_future();
    try {
        std::thread(std::move(task)).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(gate->mu);
            gate->busy = false;
        }
        gate->idle.notify_all();
        throw WalletError(WalletError::ErrorType::SignerUnavailable,
            std::string("Could not start a secure element request: ") + e.what());
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        LOG_ERROR << "Secure element did not answer within " << timeout_.count() << " ms";
        throw WalletError(WalletError::ErrorType::SignerUnavailable,
            "Secure element timed out after " + std::to_string(timeout_.count()) + " ms");
    }
    // Rethrows whatever sign_hash threw
    return future.get();
}

Account HardwareSigner::probe() {
    SignaturePayload payload = timed_sign(probe_hash());
    Address address = Address::from_public_key(payload.signer_public_key);
    LOG_DEBUG << "Hardware probe resolved " << address.to_checksum_string();
    return Account{.address = address, .kind = BackendKind::Hardware, .cached_balance = std::nullopt};
}

std::optional<Account> HardwareSigner::locate() {
    if (!element_->is_available()) {
        return std::nullopt;
    }
    if (!element_->locate_existing_key()) {
        return std::nullopt;
    }
    return probe();
}

Account HardwareSigner::create(bool require_biometric) {
    if (!element_->is_available()) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable, "Secure element is not available on this device");
    }

    auto generated = element_->generate_key(require_biometric);
    LOG_INFO << "Secure element generated a key (biometric " << (require_biometric ? "required" : "not required") << ")";

    // The generated public key is not trusted; the probe decides the address
    Account account = probe();
    try {
        if (Address::from_public_key(generated) != account.address) {
            LOG_WARN << "Secure element key generation reported a different key than it signs with; using "
                     << account.address.to_checksum_string();
        }
    } catch (const WalletError& e) {
        LOG_WARN << "Secure element returned an unusable public key on generation: " << e.what();
    }
    return account;
}

SignOutcome HardwareSigner::sign(const UnsignedTransaction& tx) {
    Hash256 hash = tx.signing_hash();
    LOG_DEBUG << "Hardware signing " << HexUtils::encode_prefixed(hash);
    SignaturePayload payload = timed_sign(hash);
    return SignatureReconciler::reconcile(tx, payload);
}

std::string HardwareSigner::sign_message(const std::string& message) {
    Hash256 hash = HashUtils::personal_message_hash(message);
    SignaturePayload payload = timed_sign(hash);

    Address expected;
    try {
        expected = Address::from_public_key(payload.signer_public_key);
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::SignatureVerificationFailed,
            std::string("Signer returned an unusable public key: ") + e.what());
    }

    Scalar s = Secp256k1::normalize_s(payload.s);
    auto v = SignatureReconciler::find_recovery_id(hash, payload.r, s, expected);
    if (!v) {
        LOG_ERROR << "Message signature does not recover to " << expected.to_checksum_string();
        throw WalletError(WalletError::ErrorType::SignatureVerificationFailed,
            "No recovery id maps the message signature to " + expected.to_checksum_string());
    }
    return encode_message_signature(payload.r, s, *v);
}

void HardwareSigner::remove() {
    if (!element_->delete_key()) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable, "Secure element refused to delete its key");
    }
    LOG_INFO << "Hardware key deleted";
}

} // namespace securewallet
