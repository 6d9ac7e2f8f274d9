#include "core/feature_extractor.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>

const std::vector<std::string> &FeatureNames::all()
{
    static const std::vector<std::string> names = {
        NOISE_ANALYSIS,
        FACIAL_FEATURES,
        COMPRESSION_ARTIFACTS,
        TEMPORAL_CONSISTENCY,
        METADATA_ANALYSIS,
        PATTERN_ANALYSIS,
        EDGE_CONSISTENCY,
        COLOR_DISTRIBUTION,
        TEXTURE_PATTERNS,
        FREQUENCY_ANALYSIS,
        STATISTICAL_METRICS};
    return names;
}

double FeatureExtractor::clampScore(double value)
{
    if (std::isnan(value))
        return kNeutralScore;
    return std::max(kMinScore, std::min(kMaxScore, value));
}

double FeatureExtractor::score(BufferView buffer, MediaFormat format) const
{
    if (buffer.empty() || format == MediaFormat::UNKNOWN)
    {
        return kNeutralScore;
    }

    try
    {
        return clampScore(compute(buffer, format));
    }
    catch (const std::exception &e)
    {
        Logger::error("Feature extractor " + name() + " failed: " + std::string(e.what()) +
                      ", using neutral score");
        return kNeutralScore;
    }
}
