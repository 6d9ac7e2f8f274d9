#include "core/extractors/placeholder_extractor.hpp"
#include "core/content_hash.hpp"
#include <utility>

PlaceholderExtractor::PlaceholderExtractor(std::string name, std::vector<PlaceholderComponent> components, bool video_only)
    : name_(std::move(name)), components_(std::move(components)), video_only_(video_only)
{
}

double PlaceholderExtractor::compute(BufferView buffer, MediaFormat format) const
{
    if (video_only_ && !MediaTypes::isVideo(format))
    {
        return kNeutralScore;
    }

    const uint32_t hash = ContentHash::jenkinsHash(buffer);
    double score = kNeutralScore;
    for (const auto &component : components_)
    {
        score += static_cast<double>(ContentHash::reduce(hash, component.divisor)) * component.weight;
    }
    return score;
}

// Divisors stay within 25-50 and differ per extractor so the sub-scores do
// not move in lockstep.

std::unique_ptr<PlaceholderExtractor> PlaceholderExtractor::facialFeatures()
{
    return std::make_unique<PlaceholderExtractor>(
        FeatureNames::FACIAL_FEATURES,
        std::vector<PlaceholderComponent>{{"landmark_alignment", 47, 0.50}, {"blending_boundary", 31, 0.40}});
}

std::unique_ptr<PlaceholderExtractor> PlaceholderExtractor::temporalConsistency()
{
    return std::make_unique<PlaceholderExtractor>(
        FeatureNames::TEMPORAL_CONSISTENCY,
        std::vector<PlaceholderComponent>{{"motion_continuity", 39, 0.50}, {"flicker", 28, 0.45}},
        true);
}

std::unique_ptr<PlaceholderExtractor> PlaceholderExtractor::edgeConsistency()
{
    return std::make_unique<PlaceholderExtractor>(
        FeatureNames::EDGE_CONSISTENCY,
        std::vector<PlaceholderComponent>{{"edge_density", 37, 0.60}, {"edge_sharpness", 29, 0.50}});
}

std::unique_ptr<PlaceholderExtractor> PlaceholderExtractor::colorDistribution()
{
    return std::make_unique<PlaceholderExtractor>(
        FeatureNames::COLOR_DISTRIBUTION,
        std::vector<PlaceholderComponent>{{"channel_balance", 41, 0.50}, {"saturation_spread", 26, 0.60}});
}

std::unique_ptr<PlaceholderExtractor> PlaceholderExtractor::texturePatterns()
{
    return std::make_unique<PlaceholderExtractor>(
        FeatureNames::TEXTURE_PATTERNS,
        std::vector<PlaceholderComponent>{{"local_contrast", 43, 0.45}, {"grain_regularity", 27, 0.55}});
}

std::unique_ptr<PlaceholderExtractor> PlaceholderExtractor::frequencyAnalysis()
{
    return std::make_unique<PlaceholderExtractor>(
        FeatureNames::FREQUENCY_ANALYSIS,
        std::vector<PlaceholderComponent>{{"high_frequency_energy", 50, 0.40}, {"spectral_peaks", 33, 0.50}});
}

std::unique_ptr<PlaceholderExtractor> PlaceholderExtractor::statisticalMetrics()
{
    return std::make_unique<PlaceholderExtractor>(
        FeatureNames::STATISTICAL_METRICS,
        std::vector<PlaceholderComponent>{{"mean_deviation", 25, 0.40}, {"skewness", 35, 0.35}, {"kurtosis", 45, 0.30}});
}
