// MATEICO - SHA256 Hash Function
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// SHA-256 hashing backed by the OpenSSL EVP digest interface.

#ifndef MATEICO_CRYPTO_SHA256_H
#define MATEICO_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "mateico/core/types.h"

// Forward declaration to keep OpenSSL out of the public header
struct evp_md_ctx_st;

namespace mateico {

/// SHA-256 hasher class
/// Provides incremental hashing: Write() any number of times, then Finalize()
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Default constructor - initializes to empty state
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Derive a stable 160-bit identity from a text label
/// (the first 20 bytes of SHA256(label))
Address AddressFromLabel(const std::string& label);

} // namespace mateico

#endif // MATEICO_CRYPTO_SHA256_H
