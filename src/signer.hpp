#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "address.hpp"
#include "hex_utils.hpp"
#include "transaction.hpp"

namespace securewallet {

enum class BackendKind {
    Hardware,
    Software,
    External
};

inline const char* backend_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::Hardware: return "hardware";
        case BackendKind::Software: return "software";
        case BackendKind::External: return "external";
    }
    return "unknown";
}

struct Account {
    Address address;
    BackendKind kind = BackendKind::Software;
    std::optional<std::string> cached_balance;  // whole units, as last fetched
};

// The remote wallet signed and broadcast on its own; only the hash comes back
struct ExternalSubmission {
    std::string tx_hash;
};

using SignOutcome = std::variant<SignedTransaction, ExternalSubmission>;

// One key-holding backend. Implementations never hand out private keys.
class Signer {
public:
    virtual ~Signer() = default;

    virtual BackendKind kind() const = 0;

    // Whether the backend can be used at all on this device/session
    virtual bool is_available() = 0;

    // The account whose key this backend currently holds, if any
    virtual std::optional<Account> locate() = 0;

    virtual Account create(bool require_biometric) = 0;

    virtual SignOutcome sign(const UnsignedTransaction& tx) = 0;

    // EIP-191 personal message signature, 0x-prefixed r || s || v
    virtual std::string sign_message(const std::string& message) = 0;

    // Discards the key (or the pairing)
    virtual void remove() = 0;
};

// 65-byte r || s || v rendering shared by the local backends
inline std::string encode_message_signature(const Scalar& r, const Scalar& s, uint8_t v) {
    std::vector<uint8_t> bytes(r.begin(), r.end());
    bytes.insert(bytes.end(), s.begin(), s.end());
    bytes.push_back(v);
    return HexUtils::encode_prefixed(bytes);
}

} // namespace securewallet
