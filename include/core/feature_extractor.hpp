#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/media_types.hpp"

/**
 * @brief Named feature scores, each in [0, 100]
 */
using FeatureSet = std::map<std::string, double>;

/**
 * @brief Keys of the feature contribution map
 */
struct FeatureNames
{
    static constexpr const char *NOISE_ANALYSIS = "noise_analysis";
    static constexpr const char *FACIAL_FEATURES = "facial_features";
    static constexpr const char *COMPRESSION_ARTIFACTS = "compression_artifacts";
    static constexpr const char *TEMPORAL_CONSISTENCY = "temporal_consistency";
    static constexpr const char *METADATA_ANALYSIS = "metadata_analysis";
    static constexpr const char *PATTERN_ANALYSIS = "pattern_analysis";
    static constexpr const char *EDGE_CONSISTENCY = "edge_consistency";
    static constexpr const char *COLOR_DISTRIBUTION = "color_distribution";
    static constexpr const char *TEXTURE_PATTERNS = "texture_patterns";
    static constexpr const char *FREQUENCY_ANALYSIS = "frequency_analysis";
    static constexpr const char *STATISTICAL_METRICS = "statistical_metrics";

    // All keys, in extractor registration order
    static const std::vector<std::string> &all();
};

/**
 * @brief Capability interface shared by every feature extractor
 *
 * score() is the only entry point callers use. It handles the cases every
 * extractor treats the same way (empty buffers, unknown media types, failures
 * inside compute()) and clamps the result, so implementations only provide
 * the format-specific computation. Placeholder extractors and real signal
 * analysis sit behind the same interface, which lets a genuine algorithm
 * replace a placeholder without touching the scorer, classifier or merger.
 */
class FeatureExtractor
{
public:
    static constexpr double kNeutralScore = 50.0;
    static constexpr double kMinScore = 0.0;
    static constexpr double kMaxScore = 100.0;

    virtual ~FeatureExtractor() = default;

    /**
     * @brief Feature key this extractor reports under
     */
    virtual std::string name() const = 0;

    /**
     * @brief Score a buffer; never throws
     * @param buffer Media bytes
     * @param format Format parsed from the declared MIME type
     * @return Score in [0, 100], kNeutralScore for empty buffers or unknown types
     */
    double score(BufferView buffer, MediaFormat format) const;

    static double clampScore(double value);

protected:
    /**
     * @brief Format-specific computation; buffer is non-empty and format is known
     */
    virtual double compute(BufferView buffer, MediaFormat format) const = 0;
};
