#include "external_signer.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logger.hpp"

using json = nlohmann::json;

namespace securewallet {

namespace {

std::string quantity(uint64_t value) {
    return Uint256(value).to_hex_quantity();
}

bool is_tx_hash(const std::string& text) {
    if (!HexUtils::has_prefix(text) || text.size() != 2 + 2 * HASH_SIZE) {
        return false;
    }
    for (size_t i = 2; i < text.size(); ++i) {
        if (HexUtils::nibble(text[i]) < 0) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

void ExternalSigner::attach(std::shared_ptr<PairingSession> session) {
    std::lock_guard<std::mutex> lock(mu_);
    session_ = std::move(session);
}

void ExternalSigner::detach() {
    std::lock_guard<std::mutex> lock(mu_);
    session_.reset();
}

bool ExternalSigner::has_session() const {
    std::lock_guard<std::mutex> lock(mu_);
    return session_ != nullptr;
}

std::shared_ptr<PairingSession> ExternalSigner::session() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!session_) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable, "No external wallet is paired");
    }
    return session_;
}

std::optional<Account> ExternalSigner::locate() {
    if (!has_session()) {
        return std::nullopt;
    }

    json accounts = session()->request("eth_accounts", json::array());
    if (!accounts.is_array() || accounts.empty()) {
        return std::nullopt;
    }
    if (!accounts[0].is_string()) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable,
            "Remote wallet returned a malformed account list: " + accounts.dump());
    }
    return Account{
        .address = Address::parse(accounts[0].get<std::string>()),
        .kind = BackendKind::External,
        .cached_balance = std::nullopt
    };
}

Account ExternalSigner::create(bool /*require_biometric*/) {
    auto account = locate();
    if (!account) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable,
            "External wallets are created by pairing a remote wallet");
    }
    return *account;
}

// The full transaction goes out so the remote user sees exactly what was
// built here. The remote wallet may still substitute its own gas values.
SignOutcome ExternalSigner::sign(const UnsignedTransaction& tx) {
    auto account = locate();
    if (!account) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable, "Paired wallet exposes no account");
    }

    json request = {
        {"from", account->address.to_checksum_string()},
        {"to", tx.to.to_checksum_string()},
        {"value", tx.value.to_hex_quantity()},
        {"gas", quantity(tx.gas_limit)},
        {"gasPrice", tx.gas_price.to_hex_quantity()},
        {"nonce", quantity(tx.nonce)},
        {"chainId", quantity(tx.chain_id)},
        {"data", HexUtils::encode_prefixed(tx.data)}
    };

    json result = session()->request("eth_sendTransaction", json::array({request}));
    if (!result.is_string() || !is_tx_hash(result.get<std::string>())) {
        throw WalletError(WalletError::ErrorType::BroadcastRejected,
            "Remote wallet returned an unexpected response: " + result.dump());
    }

    LOG_INFO << "Remote wallet submitted " << result.get<std::string>();
    return ExternalSubmission{.tx_hash = result.get<std::string>()};
}

std::string ExternalSigner::sign_message(const std::string& message) {
    auto account = locate();
    if (!account) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable, "Paired wallet exposes no account");
    }

    std::vector<uint8_t> bytes(message.begin(), message.end());
    json result = session()->request("personal_sign",
        json::array({HexUtils::encode_prefixed(bytes), account->address.to_checksum_string()}));
    if (!result.is_string()) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable,
            "Remote wallet returned an unexpected signature: " + result.dump());
    }
    return result.get<std::string>();
}

void ExternalSigner::remove() {
    std::shared_ptr<PairingSession> session;
    {
        std::lock_guard<std::mutex> lock(mu_);
        session = std::move(session_);
        session_.reset();
    }
    if (session) {
        session->disconnect();
        LOG_INFO << "External wallet disconnected";
    }
}

} // namespace securewallet
