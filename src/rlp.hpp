#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "uint256.hpp"

namespace securewallet {

// A decoded RLP item: either a byte string or a list of items
struct RlpItem {
    bool is_list = false;
    std::vector<uint8_t> bytes;
    std::vector<RlpItem> items;

    // Interpret a byte string as a canonical big-endian integer
    Uint256 as_uint256() const;
    uint64_t as_uint64() const;
};

// Recursive Length Prefix codec, the serialization used for transactions
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/
class Rlp {
public:
    // Encode a byte string
    static std::vector<uint8_t> encode_bytes(std::span<const uint8_t> data);

    // Encode an integer as its minimal big-endian byte string (zero is empty)
    static std::vector<uint8_t> encode_uint(const Uint256& value);
    static std::vector<uint8_t> encode_uint(uint64_t value);

    // Encode a list whose items are already RLP encoded
    static std::vector<uint8_t> encode_list(const std::vector<std::vector<uint8_t>>& encoded_items);

    // Decode exactly one item spanning the whole input
    // Throws WalletError(InvalidInput) on truncated, trailing or non-canonical data
    static RlpItem decode(std::span<const uint8_t> data);

private:
    Rlp() = delete;
};

} // namespace securewallet
