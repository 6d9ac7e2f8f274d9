#include "core/extractors/compression_extractor.hpp"
#include "core/content_hash.hpp"
#include <algorithm>

JpegMarkerCounts CompressionExtractor::countJpegMarkers(BufferView buffer)
{
    JpegMarkerCounts counts;
    if (buffer.size < 2)
        return counts;

    for (std::size_t i = 0; i + 1 < buffer.size; ++i)
    {
        if (buffer[i] != 0xFF)
            continue;

        const uint8_t next = buffer[i + 1];
        if (next >= 0xC0 && next <= 0xCF)
            ++counts.frame_markers;
        else if (next == 0xDB)
            ++counts.quantization_tables;
    }
    return counts;
}

double CompressionExtractor::compute(BufferView buffer, MediaFormat format) const
{
    const uint32_t hash = ContentHash::jenkinsHash(buffer);

    switch (format)
    {
    case MediaFormat::JPEG:
    {
        const JpegMarkerCounts counts = countJpegMarkers(buffer);
        const double artifact_score = ContentHash::reduce(hash, 100);
        return std::min(100.0, 30.0 + static_cast<double>(counts.frame_markers) * 5.0 +
                                   static_cast<double>(counts.quantization_tables) * 8.0 +
                                   artifact_score * 0.7);
    }
    case MediaFormat::PNG:
    {
        const double chunk_score = ContentHash::reduce(hash, 50);
        const double consistency_score = ContentHash::reduce(hash, 35);
        return std::min(100.0, 45.0 + chunk_score * 0.6 + consistency_score * 0.4);
    }
    case MediaFormat::MP4:
    case MediaFormat::QUICKTIME:
    case MediaFormat::OTHER_VIDEO:
    {
        const double frame_analysis = ContentHash::reduce(hash, 40);
        const double codec_consistency = ContentHash::reduce(hash, 30);
        return std::min(100.0, 40.0 + frame_analysis * 0.5 + codec_consistency * 0.5);
    }
    default:
        return kNeutralScore;
    }
}
