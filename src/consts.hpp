#pragma once

#include <cstddef>
#include <cstdint>

namespace securewallet {

    // Key and address sizes
    constexpr uint8_t UNCOMPRESSED_PUBKEY_MARKER = 0x04;
    constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65; // marker + X + Y
    constexpr size_t RAW_PUBKEY_SIZE = 64;          // X + Y
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    constexpr size_t ADDRESS_SIZE = 20;
    constexpr size_t HASH_SIZE = 32;

    // Signature recovery identifiers (Ethereum "v" before replay protection)
    constexpr uint8_t RECOVERY_ID_LOW = 27;
    constexpr uint8_t RECOVERY_ID_HIGH = 28;

    // EIP-155 replay protection: V = chain_id * 2 + 35 + recovery_bit
    constexpr uint64_t EIP155_V_OFFSET = 35;

    // Transaction-related constants
    constexpr uint8_t LEGACY_TX_TYPE = 0x00;
    constexpr uint64_t ETHER_DECIMALS = 18;
    constexpr uint64_t DEFAULT_TRANSFER_GAS = 21000;

    // Network defaults (Sepolia)
    constexpr uint64_t DEFAULT_CHAIN_ID = 11155111;
    constexpr auto DEFAULT_RPC_URL = "https://rpc.sepolia.org";

    // Anti-fat-finger guard, in whole units
    constexpr auto DEFAULT_MAX_SEND_AMOUNT = "1000";

    // Secure element round trip deadline
    constexpr uint32_t DEFAULT_HARDWARE_TIMEOUT_MS = 30000;

    // Advisory confirmation polling
    constexpr uint32_t DEFAULT_CONFIRMATIONS = 1;
    constexpr uint32_t DEFAULT_CONFIRMATION_POLL_MS = 4000;
    constexpr uint32_t DEFAULT_CONFIRMATION_MAX_POLLS = 45;

    // Software key sealing (AES-256-GCM, PBKDF2-HMAC-SHA256)
    constexpr size_t AES_KEY_SIZE = 32;
    constexpr size_t AES_GCM_NONCE_SIZE = 12;
    constexpr size_t AES_GCM_TAG_SIZE = 16;
    constexpr size_t KDF_SALT_SIZE = 16;
    constexpr int KDF_ITERATIONS = 210000;

    // Key store entry identifiers
    constexpr auto SOFTWARE_KEY_ENTRY = "software_private_key";
    constexpr auto SOFTWARE_ADDRESS_ENTRY = "software_address";

} // namespace securewallet
