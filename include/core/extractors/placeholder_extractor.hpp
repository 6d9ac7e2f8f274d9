#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/feature_extractor.hpp"

/**
 * @brief One hash-derived term of a placeholder score
 */
struct PlaceholderComponent
{
    std::string name; // Sub-metric the term stands in for
    uint32_t divisor; // Modulo applied to the content hash (distinct per term)
    double weight;
};

/**
 * @brief Hash-derived stand-in for a feature without a real algorithm
 *
 * NOT a computer-vision measurement: score = 50 + sum(hash mod divisor * weight),
 * clamped to [0, 100]. Kept behind FeatureExtractor so a genuine implementation
 * can replace it later.
 */
class PlaceholderExtractor : public FeatureExtractor
{
public:
    /**
     * @param name Feature key
     * @param components Hash terms, each with its own divisor
     * @param video_only When true, images score neutral (e.g. temporal consistency)
     */
    PlaceholderExtractor(std::string name, std::vector<PlaceholderComponent> components, bool video_only = false);

    std::string name() const override { return name_; }
    const std::vector<PlaceholderComponent> &components() const { return components_; }
    bool isVideoOnly() const { return video_only_; }

    // Factories for the placeholder features of the default pipeline
    static std::unique_ptr<PlaceholderExtractor> facialFeatures();
    static std::unique_ptr<PlaceholderExtractor> temporalConsistency();
    static std::unique_ptr<PlaceholderExtractor> edgeConsistency();
    static std::unique_ptr<PlaceholderExtractor> colorDistribution();
    static std::unique_ptr<PlaceholderExtractor> texturePatterns();
    static std::unique_ptr<PlaceholderExtractor> frequencyAnalysis();
    static std::unique_ptr<PlaceholderExtractor> statisticalMetrics();

protected:
    double compute(BufferView buffer, MediaFormat format) const override;

private:
    std::string name_;
    std::vector<PlaceholderComponent> components_;
    bool video_only_;
};
