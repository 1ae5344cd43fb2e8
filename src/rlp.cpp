#include "rlp.hpp"
#include "error.hpp"

namespace securewallet {

namespace {

constexpr uint8_t OFFSET_SHORT_STRING = 0x80;
constexpr uint8_t OFFSET_LONG_STRING = 0xb7;
constexpr uint8_t OFFSET_SHORT_LIST = 0xc0;
constexpr uint8_t OFFSET_LONG_LIST = 0xf7;
constexpr size_t SHORT_PAYLOAD_LIMIT = 56;

[[noreturn]] void malformed(const std::string& what) {
    throw WalletError(WalletError::ErrorType::InvalidInput, "Malformed RLP: " + what);
}

std::vector<uint8_t> big_endian_length(size_t length) {
    std::vector<uint8_t> out;
    while (length > 0) {
        out.insert(out.begin(), static_cast<uint8_t>(length & 0xff));
        length >>= 8;
    }
    return out;
}

// Prefix for a payload of the given length:
// - [0x80 + len] or [0xc0 + len] for payloads shorter than 56 bytes
// - [0xb7 + len(len)] or [0xf7 + len(len)] followed by the big-endian length otherwise
std::vector<uint8_t> encode_length(size_t length, uint8_t short_offset, uint8_t long_offset) {
    if (length < SHORT_PAYLOAD_LIMIT) {
        return {static_cast<uint8_t>(short_offset + length)};
    }
    auto length_bytes = big_endian_length(length);
    std::vector<uint8_t> prefix;
    prefix.push_back(static_cast<uint8_t>(long_offset + length_bytes.size()));
    prefix.insert(prefix.end(), length_bytes.begin(), length_bytes.end());
    return prefix;
}

// Reads the long-form length that follows a 0xb8..0xbf / 0xf8..0xff prefix
size_t read_long_length(std::span<const uint8_t> data, size_t pos, size_t length_of_length) {
    if (length_of_length > sizeof(size_t) || pos + length_of_length > data.size()) {
        malformed("truncated length");
    }
    if (data[pos] == 0) {
        malformed("length with leading zero");
    }
    size_t length = 0;
    for (size_t i = 0; i < length_of_length; ++i) {
        length = (length << 8) | data[pos + i];
    }
    if (length < SHORT_PAYLOAD_LIMIT) {
        malformed("long form used for short payload");
    }
    return length;
}

RlpItem decode_item(std::span<const uint8_t> data, size_t& pos) {
    if (pos >= data.size()) {
        malformed("unexpected end of input");
    }

    uint8_t prefix = data[pos];
    RlpItem item;

    // Single byte below 0x80 is its own encoding
    if (prefix < OFFSET_SHORT_STRING) {
        item.bytes.push_back(prefix);
        pos += 1;
        return item;
    }

    size_t payload_start = 0;
    size_t payload_length = 0;

    if (prefix <= OFFSET_LONG_STRING) {
        payload_length = prefix - OFFSET_SHORT_STRING;
        payload_start = pos + 1;
        if (payload_length == 1 && payload_start < data.size() && data[payload_start] < OFFSET_SHORT_STRING) {
            malformed("single byte should not be prefixed");
        }
    } else if (prefix < OFFSET_SHORT_LIST) {
        size_t length_of_length = prefix - OFFSET_LONG_STRING;
        payload_length = read_long_length(data, pos + 1, length_of_length);
        payload_start = pos + 1 + length_of_length;
    } else if (prefix <= OFFSET_LONG_LIST) {
        item.is_list = true;
        payload_length = prefix - OFFSET_SHORT_LIST;
        payload_start = pos + 1;
    } else {
        item.is_list = true;
        size_t length_of_length = prefix - OFFSET_LONG_LIST;
        payload_length = read_long_length(data, pos + 1, length_of_length);
        payload_start = pos + 1 + length_of_length;
    }

    if (payload_start > data.size() || payload_length > data.size() - payload_start) {
        malformed("payload exceeds input");
    }

    size_t payload_end = payload_start + payload_length;
    if (item.is_list) {
        size_t cursor = payload_start;
        auto list_span = data.subspan(0, payload_end);
        while (cursor < payload_end) {
            item.items.push_back(decode_item(list_span, cursor));
        }
    } else {
        item.bytes.assign(data.begin() + payload_start, data.begin() + payload_end);
    }

    pos = payload_end;
    return item;
}

} // anonymous namespace

Uint256 RlpItem::as_uint256() const {
    if (is_list) {
        malformed("expected integer, found list");
    }
    if (!bytes.empty() && bytes.front() == 0) {
        malformed("integer with leading zero");
    }
    if (bytes.size() > 32) {
        malformed("integer wider than 256 bits");
    }
    return Uint256::from_bytes(bytes);
}

uint64_t RlpItem::as_uint64() const {
    return as_uint256().to_uint64();
}

std::vector<uint8_t> Rlp::encode_bytes(std::span<const uint8_t> data) {
    if (data.size() == 1 && data[0] < OFFSET_SHORT_STRING) {
        return {data[0]};
    }
    auto encoded = encode_length(data.size(), OFFSET_SHORT_STRING, OFFSET_LONG_STRING);
    encoded.insert(encoded.end(), data.begin(), data.end());
    return encoded;
}

std::vector<uint8_t> Rlp::encode_uint(const Uint256& value) {
    return encode_bytes(value.to_minimal_bytes());
}

std::vector<uint8_t> Rlp::encode_uint(uint64_t value) {
    return encode_uint(Uint256(value));
}

std::vector<uint8_t> Rlp::encode_list(const std::vector<std::vector<uint8_t>>& encoded_items) {
    size_t payload_length = 0;
    for (const auto& item : encoded_items) {
        payload_length += item.size();
    }

    auto encoded = encode_length(payload_length, OFFSET_SHORT_LIST, OFFSET_LONG_LIST);
    encoded.reserve(encoded.size() + payload_length);
    for (const auto& item : encoded_items) {
        encoded.insert(encoded.end(), item.begin(), item.end());
    }
    return encoded;
}

RlpItem Rlp::decode(std::span<const uint8_t> data) {
    size_t pos = 0;
    RlpItem item = decode_item(data, pos);
    if (pos != data.size()) {
        malformed("trailing bytes after item");
    }
    return item;
}

} // namespace securewallet
