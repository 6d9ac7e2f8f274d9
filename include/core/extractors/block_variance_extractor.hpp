#pragma once

#include <cstddef>
#include "core/feature_extractor.hpp"

/**
 * @brief Repeating-pattern analysis from the spread of per-section variances
 *
 * The buffer is cut into kSectionCount equal sections; the variance of the
 * section variances (meta-variance) flags content that is either too uniform
 * or too erratic. Score = 30 + min(100, sqrt(metaVariance) / 100) * 0.4 + hash mod 30.
 */
class BlockVarianceExtractor : public FeatureExtractor
{
public:
    static constexpr std::size_t kSectionCount = 10;

    std::string name() const override { return FeatureNames::PATTERN_ANALYSIS; }

    /**
     * @brief Variance of the per-section byte variances, 0 when the buffer has fewer than kSectionCount bytes
     */
    static double metaVariance(BufferView buffer);

protected:
    double compute(BufferView buffer, MediaFormat format) const override;
};
