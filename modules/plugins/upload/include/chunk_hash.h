#ifndef CHUNK_HASH_H
#define CHUNK_HASH_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Initializes libsodium once per process. Throws std::runtime_error on failure.
void ensure_crypto_initialized();

// Lowercase hex SHA-256 of the buffer.
std::string sha256_hex(const uint8_t* data, size_t len);
std::string sha256_hex(const std::vector<uint8_t>& data);

// Random RFC 4122 version 4 id, e.g. "3f2b8c1e-....".
std::string generate_upload_id();

#endif // CHUNK_HASH_H
