// =============================================================================
// test_transaction_builder.cpp: recipient and amount validation
// =============================================================================

#include <gtest/gtest.h>
#include "error.hpp"
#include "transaction_builder.hpp"

using namespace securewallet;

namespace {

const std::string RECIPIENT = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";

WalletError::ErrorType build_error(const TransactionBuilder& builder, const std::string& to, const std::string& amount) {
    try {
        builder.build(to, amount, 0, Uint256(1), 21000, 11155111);
    } catch (const WalletError& e) {
        return e.type();
    }
    ADD_FAILURE() << "build(" << to << ", " << amount << ") did not throw";
    return WalletError::ErrorType::ConfigError;
}

} // anonymous namespace

TEST(TransactionBuilder, BuildsLegacyTransaction) {
    TransactionBuilder builder("1000");
    auto tx = builder.build(RECIPIENT, "0.5", 3, Uint256(20'000'000'000ULL), 21000, 11155111);

    EXPECT_EQ(tx.to.to_checksum_string(), RECIPIENT);
    EXPECT_EQ(tx.value.to_decimal(), "500000000000000000");
    EXPECT_EQ(tx.nonce, 3u);
    EXPECT_EQ(tx.gas_limit, 21000u);
    EXPECT_EQ(tx.gas_price.to_decimal(), "20000000000");
    EXPECT_EQ(tx.chain_id, 11155111u);
    EXPECT_TRUE(tx.data.empty());
    EXPECT_EQ(tx.tx_type, LEGACY_TX_TYPE);
}

TEST(TransactionBuilder, AmountBoundaries) {
    TransactionBuilder builder("1000");
    EXPECT_EQ(build_error(builder, RECIPIENT, "0"), WalletError::ErrorType::InvalidInput);
    EXPECT_EQ(build_error(builder, RECIPIENT, "1000.000000000000000001"), WalletError::ErrorType::InvalidInput);
    EXPECT_NO_THROW(builder.build(RECIPIENT, "1000", 0, Uint256(1), 21000, 11155111));
    EXPECT_NO_THROW(builder.build(RECIPIENT, "0.000000000000000001", 0, Uint256(1), 21000, 11155111));
}

TEST(TransactionBuilder, MalformedAmounts) {
    TransactionBuilder builder("1000");
    for (const char* bad : {"", "-1", "1e3", "abc", "0.0000000000000000001", "1.5.0", " 1"}) {
        EXPECT_EQ(build_error(builder, RECIPIENT, bad), WalletError::ErrorType::InvalidInput) << bad;
    }
}

TEST(TransactionBuilder, MalformedRecipients) {
    TransactionBuilder builder("1000");
    EXPECT_EQ(build_error(builder, "", "1"), WalletError::ErrorType::InvalidInput);
    EXPECT_EQ(build_error(builder, "0x1234", "1"), WalletError::ErrorType::InvalidInput);
    EXPECT_EQ(build_error(builder, "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD", "1"),
              WalletError::ErrorType::InvalidInput);
}

TEST(TransactionBuilder, ErrorNamesTheFailedCheck) {
    TransactionBuilder builder("1000");
    try {
        builder.parse_amount("1001");
        FAIL() << "expected InvalidInput";
    } catch (const WalletError& e) {
        EXPECT_NE(std::string(e.what()).find("exceeds"), std::string::npos);
    }
}

TEST(TransactionBuilder, CustomCeiling) {
    TransactionBuilder builder("0.1");
    EXPECT_NO_THROW(builder.parse_amount("0.1"));
    EXPECT_THROW(builder.parse_amount("0.100000000000000001"), WalletError);
}

TEST(TransactionBuilder, RejectsZeroGasOrChain) {
    TransactionBuilder builder("1000");
    EXPECT_THROW(builder.build(RECIPIENT, "1", 0, Uint256(1), 0, 1), WalletError);
    EXPECT_THROW(builder.build(RECIPIENT, "1", 0, Uint256(1), 21000, 0), WalletError);
}
