#pragma once

#include <cstddef>
#include <cstdint>

namespace sigindex {

// Default MinHash parameters
inline constexpr uint32_t DEFAULT_SEED = 42;
inline constexpr const char* DEFAULT_MOLTYPE = "DNA";
inline constexpr const char* DEFAULT_LICENSE = "CC0";
inline constexpr const char* DEFAULT_HASH_FUNCTION = "0.murmur64";

// Signature JSON format version written by the encoder
inline constexpr double SIGNATURE_FORMAT_VERSION = 0.4;

// Recognized signature file suffixes (plain and gzip-compressed)
inline constexpr const char* SIG_SUFFIX = ".sig";
inline constexpr const char* SIG_GZ_SUFFIX = ".sig.gz";
inline constexpr const char* ZIP_SUFFIX = ".zip";

// Signatures scored per parallel batch in search/gather.
// Batches are appended in scan order, so output does not depend on this.
inline constexpr size_t SCORE_BATCH_SIZE = 1024;

// Largest hash value kept for a given scaled factor.
// scaled <= 1 keeps every hash.
inline constexpr uint64_t max_hash_for_scaled(uint64_t scaled) {
    if (scaled <= 1) return UINT64_MAX;
    // 2^64 / scaled without overflowing: (2^64 - 1) / scaled, adjusted for exact divisors
    uint64_t q = UINT64_MAX / scaled;
    if (UINT64_MAX % scaled == scaled - 1) q++;
    return q;
}

// Inverse of max_hash_for_scaled, rounded to nearest.
inline constexpr uint64_t scaled_for_max_hash(uint64_t max_hash) {
    if (max_hash == 0) return 0;
    if (max_hash == UINT64_MAX) return 1;
    uint64_t q = UINT64_MAX / max_hash;
    uint64_t r = UINT64_MAX % max_hash + 1;   // remainder of 2^64 / max_hash
    if (r == max_hash) { q++; r = 0; }
    if (r >= max_hash - r) q++;
    return q;
}

} // namespace sigindex
