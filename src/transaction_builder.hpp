#pragma once

#include <cstdint>
#include <string>
#include "address.hpp"
#include "transaction.hpp"
#include "uint256.hpp"

namespace securewallet {

// Turns a user's (recipient, amount) intent plus chain parameters fetched by
// the caller into an UnsignedTransaction. No I/O happens here.
class TransactionBuilder {
public:
    // max_send_amount is in whole units ("1000")
    explicit TransactionBuilder(const std::string& max_send_amount);

    // Validated recipient. Throws WalletError(InvalidInput)
    Address parse_recipient(const std::string& to) const;

    // Amount in wei, checked to be positive and within the ceiling.
    // Throws WalletError(InvalidInput) naming the failed check
    Uint256 parse_amount(const std::string& amount) const;

    UnsignedTransaction build(const std::string& to,
                              const std::string& amount,
                              uint64_t nonce,
                              const Uint256& gas_price,
                              uint64_t gas_limit,
                              uint64_t chain_id) const;

    const Uint256& max_send_wei() const { return max_send_wei_; }

private:
    Uint256 max_send_wei_;
};

} // namespace securewallet
