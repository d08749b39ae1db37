#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace assetkit {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)

    // "sha256:<hex>" form stored in manifests
    std::string prefixed() const { return "sha256:" + hex_digest; }
};

HashResult compute_sha256_bytes(const std::string& data);
HashResult compute_sha256_bytes(const std::vector<uint8_t>& data);
HashResult compute_sha256_file(const std::string& file_path);

// Compare a stored "sha256:<hex>" value with a bare or prefixed digest
bool hashes_equal(const std::string& a, const std::string& b);

} // namespace assetkit
