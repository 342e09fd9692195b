#pragma once

#include <cstddef>
#include <string>

namespace cdd {

// ============================================================================
// Digests (OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string
};

// SHA-256 of in-memory data
HashResult compute_sha256(const std::string& data);

// SHA-256 of a file's contents, streamed
HashResult compute_sha256_file(const std::string& file_path);

// SHA-1 of in-memory data (run identifiers only)
HashResult compute_sha1(const std::string& data);

// ============================================================================
// Randomness
// ============================================================================

// Hex encoding of `num_bytes` cryptographically random bytes.
// Returns an empty string if the random source fails.
std::string random_hex_token(std::size_t num_bytes);

} // namespace cdd
