// =============================================================================
// test_uint256.cpp: 256-bit quantities and decimal unit conversion
// =============================================================================

#include <gtest/gtest.h>
#include "error.hpp"
#include "uint256.hpp"
#include <vector>

using namespace securewallet;

TEST(Uint256, ParseUnitsScalesExactly) {
    EXPECT_EQ(Uint256::parse_units("0.5", 18).to_decimal(), "500000000000000000");
    EXPECT_EQ(Uint256::parse_units("1000", 18).to_decimal(), "1000000000000000000000");
    EXPECT_EQ(Uint256::parse_units("0.000000000000000001", 18).to_decimal(), "1");
    EXPECT_EQ(Uint256::parse_units("0", 18).to_decimal(), "0");
}

TEST(Uint256, ParseUnitsRejectsMalformedAmounts) {
    for (const char* bad : {"", ".5", "1.", "-1", "+1", "1e18", "1,5", " 1", "1.2.3", "0x10"}) {
        EXPECT_THROW(Uint256::parse_units(bad, 18), WalletError) << bad;
    }
}

TEST(Uint256, ParseUnitsRejectsExcessPrecision) {
    EXPECT_THROW(Uint256::parse_units("0.0000000000000000001", 18), WalletError);
}

TEST(Uint256, FormatUnitsTrimsZeros) {
    EXPECT_EQ(Uint256::from_decimal("500000000000000000").format_units(18), "0.5");
    EXPECT_EQ(Uint256::from_decimal("1000000000000000000000").format_units(18), "1000");
    EXPECT_EQ(Uint256::from_decimal("1").format_units(18), "0.000000000000000001");
    EXPECT_EQ(Uint256().format_units(18), "0");
}

TEST(Uint256, HexQuantities) {
    EXPECT_EQ(Uint256::from_hex_quantity("0x5208").to_uint64(), 21000u);
    EXPECT_EQ(Uint256::from_hex_quantity("0x0").to_uint64(), 0u);
    EXPECT_EQ(Uint256(21000).to_hex_quantity(), "0x5208");
    EXPECT_EQ(Uint256().to_hex_quantity(), "0x0");
    EXPECT_EQ(Uint256(1).to_hex_quantity(), "0x1");
    EXPECT_THROW(Uint256::from_hex_quantity("5208"), WalletError);
    EXPECT_THROW(Uint256::from_hex_quantity("0x"), WalletError);
}

TEST(Uint256, MinimalBytes) {
    EXPECT_TRUE(Uint256().to_minimal_bytes().empty());
    EXPECT_EQ(Uint256(1024).to_minimal_bytes(), (std::vector<uint8_t>{0x04, 0x00}));
}

TEST(Uint256, ArithmeticAndOrdering) {
    Uint256 gas_price(20'000'000'000ULL);
    Uint256 fee = gas_price * Uint256(21000);
    EXPECT_EQ(fee.to_decimal(), "420000000000000");
    EXPECT_EQ((Uint256(1) + Uint256(2)).to_uint64(), 3u);
    EXPECT_LT(Uint256(1), Uint256(2));
    EXPECT_GT(Uint256::parse_units("1000.000000000000000001", 18), Uint256::parse_units("1000", 18));
}

TEST(Uint256, Overflow) {
    std::vector<uint8_t> max(32, 0xff);
    Uint256 top = Uint256::from_bytes(max);
    EXPECT_THROW(top + Uint256(1), WalletError);
    EXPECT_THROW(top * Uint256(2), WalletError);
    EXPECT_THROW(top.to_uint64(), WalletError);
}
