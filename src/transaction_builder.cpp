#include "transaction_builder.hpp"
#include "consts.hpp"
#include "error.hpp"

namespace securewallet {

TransactionBuilder::TransactionBuilder(const std::string& max_send_amount)
    : max_send_wei_(Uint256::parse_units(max_send_amount, ETHER_DECIMALS)) {}

Address TransactionBuilder::parse_recipient(const std::string& to) const {
    try {
        return Address::parse(to);
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::InvalidInput, std::string("Invalid recipient: ") + e.what());
    }
}

Uint256 TransactionBuilder::parse_amount(const std::string& amount) const {
    Uint256 wei;
    try {
        wei = Uint256::parse_units(amount, ETHER_DECIMALS);
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::InvalidInput, std::string("Invalid amount: ") + e.what());
    }

    if (wei.is_zero()) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Amount must be greater than zero");
    }
    if (wei > max_send_wei_) {
        throw WalletError(WalletError::ErrorType::InvalidInput,
            "Amount " + amount + " exceeds the maximum of " + max_send_wei_.format_units(ETHER_DECIMALS));
    }
    return wei;
}

UnsignedTransaction TransactionBuilder::build(const std::string& to,
                                              const std::string& amount,
                                              uint64_t nonce,
                                              const Uint256& gas_price,
                                              uint64_t gas_limit,
                                              uint64_t chain_id) const {
    Address recipient = parse_recipient(to);
    Uint256 value = parse_amount(amount);

    if (gas_limit == 0) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Gas limit must be greater than zero");
    }
    if (chain_id == 0) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Chain id must be greater than zero");
    }

    return UnsignedTransaction{
        .to = recipient,
        .value = value,
        .nonce = nonce,
        .gas_limit = gas_limit,
        .gas_price = gas_price,
        .data = {},
        .chain_id = chain_id,
        .tx_type = LEGACY_TX_TYPE,
    };
}

} // namespace securewallet
