#pragma once

#include "core/feature_extractor.hpp"

/**
 * @brief Container signature validity
 *
 * A valid magic header (and footer, for JPEG) scores low, a missing or broken
 * one scores high. Formats without a known signature score neutral.
 */
class MetadataExtractor : public FeatureExtractor
{
public:
    static constexpr double kJpegValidScore = 30.0;
    static constexpr double kJpegInvalidScore = 70.0;
    static constexpr double kPngValidScore = 35.0;
    static constexpr double kPngInvalidScore = 65.0;
    static constexpr double kVideoValidScore = 40.0;
    static constexpr double kVideoInvalidScore = 60.0;

    std::string name() const override { return FeatureNames::METADATA_ANALYSIS; }

    static bool hasJpegSignature(BufferView buffer);
    static bool hasPngSignature(BufferView buffer);
    static bool hasMp4Signature(BufferView buffer);
    static bool hasQuickTimeSignature(BufferView buffer);

protected:
    double compute(BufferView buffer, MediaFormat format) const override;
};
