#pragma once

#include <cstddef>
#include "core/feature_extractor.hpp"

/**
 * @brief Counts of JPEG marker pairs found in a byte stream
 */
struct JpegMarkerCounts
{
    std::size_t frame_markers = 0;      // 0xFF followed by 0xC0-0xCF
    std::size_t quantization_tables = 0; // 0xFF 0xDB
};

/**
 * @brief Compression-signature analysis
 *
 * JPEG scores marker and quantization table counts plus a hash-derived
 * artifact term. PNG and video scores are hash-derived placeholders.
 * Other image/video formats score neutral.
 */
class CompressionExtractor : public FeatureExtractor
{
public:
    std::string name() const override { return FeatureNames::COMPRESSION_ARTIFACTS; }

    static JpegMarkerCounts countJpegMarkers(BufferView buffer);

protected:
    double compute(BufferView buffer, MediaFormat format) const override;
};
