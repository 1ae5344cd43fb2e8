#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>
#include <stdexcept>
#include "error.hpp"

namespace securewallet {

class HexUtils {
public:
    // Convert a hexadecimal string (with or without a "0x" prefix) to a byte vector
    static std::vector<uint8_t> decode(const std::string& hex) {
        std::string digits = strip_prefix(hex);
        if (digits.length() % 2 != 0) {
            throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid hex string length");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(digits.length() / 2);

        for (size_t i = 0; i < digits.length(); i += 2) {
            int high = nibble(digits[i]);
            int low = nibble(digits[i + 1]);
            if (high < 0 || low < 0) {
                throw WalletError(WalletError::ErrorType::InvalidInput,
                    "Invalid hex character in: " + hex);
            }
            bytes.push_back(static_cast<uint8_t>((high << 4) | low));
        }

        return bytes;
    }

    // Convert bytes to a lowercase hexadecimal string without prefix
    static std::string encode(std::span<const uint8_t> data) {
        std::string result;
        result.reserve(data.size() * 2);

        static const char hex_chars[] = "0123456789abcdef";
        for (uint8_t byte : data) {
            result.push_back(hex_chars[byte >> 4]);
            result.push_back(hex_chars[byte & 0x0F]);
        }

        return result;
    }

    // Same as encode() with a "0x" prefix, the form JSON-RPC expects
    static std::string encode_prefixed(std::span<const uint8_t> data) {
        return "0x" + encode(data);
    }

    static bool has_prefix(const std::string& hex) {
        return hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
    }

    static std::string strip_prefix(const std::string& hex) {
        return has_prefix(hex) ? hex.substr(2) : hex;
    }

    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

} // namespace securewallet
