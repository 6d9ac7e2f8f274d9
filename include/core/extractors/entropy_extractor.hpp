#pragma once

#include <cstddef>
#include "core/feature_extractor.hpp"

/**
 * @brief Byte-entropy statistics of a buffer
 */
struct EntropyStats
{
    double global_entropy = 0.0;   // Shannon entropy of the full histogram, 0-8 bits
    double entropy_variance = 0.0; // Population variance of per-window entropies
    std::size_t window_count = 0;  // Number of complete windows analyzed
};

/**
 * @brief Noise analysis via global and windowed Shannon entropy
 *
 * Score = 40 + |normGlobal - 78| * 1.5 + normVariance * 0.5, where
 * normGlobal = globalEntropy / 8 * 100 and normVariance = min(100, sqrt(variance) * 20).
 * Buffers shorter than one window contribute no variance term.
 */
class EntropyExtractor : public FeatureExtractor
{
public:
    static constexpr std::size_t kWindowSize = 1024;

    std::string name() const override { return FeatureNames::NOISE_ANALYSIS; }

    /**
     * @brief Compute global entropy and local entropy variance in one pass
     */
    static EntropyStats computeStats(BufferView buffer);

protected:
    double compute(BufferView buffer, MediaFormat format) const override;
};
