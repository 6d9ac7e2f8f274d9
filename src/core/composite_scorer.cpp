#include "core/composite_scorer.hpp"
#include <cmath>
#include <utility>

CompositeScorer::CompositeScorer() : weights_(defaultWeights())
{
}

CompositeScorer::CompositeScorer(WeightTable weights) : weights_(std::move(weights))
{
}

const CompositeScorer::WeightTable &CompositeScorer::defaultWeights()
{
    static const WeightTable weights = {
        {FeatureNames::NOISE_ANALYSIS, 0.20},
        {FeatureNames::FACIAL_FEATURES, 0.15},
        {FeatureNames::COMPRESSION_ARTIFACTS, 0.15},
        {FeatureNames::TEMPORAL_CONSISTENCY, 0.10},
        {FeatureNames::METADATA_ANALYSIS, 0.10},
        {FeatureNames::PATTERN_ANALYSIS, 0.05},
        {FeatureNames::EDGE_CONSISTENCY, 0.05},
        {FeatureNames::COLOR_DISTRIBUTION, 0.05},
        {FeatureNames::TEXTURE_PATTERNS, 0.05},
        {FeatureNames::FREQUENCY_ANALYSIS, 0.05},
        {FeatureNames::STATISTICAL_METRICS, 0.05}};
    return weights;
}

double CompositeScorer::roundToTenth(double value)
{
    return std::round(value * 10.0) / 10.0;
}

double CompositeScorer::score(const FeatureSet &features) const
{
    double weighted_sum = 0.0;
    double total_weight = 0.0;

    for (const auto &[feature, value] : features)
    {
        auto it = weights_.find(feature);
        if (it == weights_.end() || !(it->second > 0.0) || !std::isfinite(value))
            continue;

        weighted_sum += FeatureExtractor::clampScore(value) * it->second;
        total_weight += it->second;
    }

    if (total_weight <= 0.0)
        return kNeutralScore;

    return FeatureExtractor::clampScore(roundToTenth(weighted_sum / total_weight));
}
