#include "chunk_hash.h"
#include "logger.h"

#include <sodium.h>
#include <mutex>
#include <stdexcept>

void ensure_crypto_initialized() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
        // sodium_init() returns 1 when already initialized elsewhere.
        ok = sodium_init() >= 0;
    });
    if (!ok) {
        LOG_ERROR("HASH: Libsodium initialization failed!");
        throw std::runtime_error("Libsodium init failed");
    }
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    ensure_crypto_initialized();

    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, data, static_cast<unsigned long long>(len));

    char hex[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
    return std::string(hex);
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string generate_upload_id() {
    ensure_crypto_initialized();

    uint8_t bytes[16];
    randombytes_buf(bytes, sizeof(bytes));
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);   // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);   // variant 10xx

    static const char* hex_chars = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) uuid += '-';
        uuid += hex_chars[bytes[i] >> 4];
        uuid += hex_chars[bytes[i] & 0x0f];
    }
    return uuid;
}
