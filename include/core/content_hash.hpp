#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "core/media_types.hpp"

/**
 * @brief Deterministic hashing over media buffers
 *
 * jenkinsHash() is the stable pseudo-random source used by placeholder
 * extractors. Its output is identical on every platform because all mixing
 * happens in 32-bit unsigned arithmetic.
 */
class ContentHash
{
public:
    // Only the first kSampleSize bytes take part in the Jenkins mix
    static constexpr std::size_t kSampleSize = 1000;

    /**
     * @brief Jenkins one-at-a-time hash with avalanche finalization
     * @param buffer Buffer to hash (only the first kSampleSize bytes are read)
     * @return Final 32-bit hash value
     */
    static uint32_t jenkinsHash(BufferView buffer);

    /**
     * @brief Reduce a Jenkins hash to [0, modulo)
     *
     * The hash is read as a signed 32-bit value and its absolute value is
     * reduced, so different divisors give nominally decorrelated sub-scores.
     * @param buffer Buffer to hash
     * @param modulo Divisor, must be positive (100 when omitted)
     * @return Integer in [0, modulo)
     */
    static uint32_t score(BufferView buffer, uint32_t modulo = 100);

    /**
     * @brief Reduce an already computed hash to [0, modulo)
     */
    static uint32_t reduce(uint32_t hash, uint32_t modulo);

    /**
     * @brief SHA-256 fingerprint of the whole buffer
     * @return Lowercase hexadecimal digest (64 characters), empty on OpenSSL failure
     */
    static std::string sha256Hex(BufferView buffer);
};
