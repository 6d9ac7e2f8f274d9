#pragma once

#include <optional>
#include "core/analysis_result.hpp"
#include "core/category_classifier.hpp"

/**
 * @brief Blends a local result with an optional remote detector result
 *
 * combined = remote * remote_weight + local * (1 - remote_weight), rounded to
 * one decimal. Only facial_features and temporal_consistency are re-blended;
 * every other field except score/category/is_deepfake passes through. Without
 * a remote result the local result is returned unchanged.
 */
class ResultMerger
{
public:
    static constexpr double kDefaultRemoteWeight = 0.6;

    ResultMerger();
    ResultMerger(CategoryClassifier classifier, double remote_weight = kDefaultRemoteWeight);

    /**
     * @brief Merge; never throws
     * @param local Result of the local pipeline
     * @param remote Remote result, std::nullopt when unavailable
     * @return Merged result, or local unchanged when remote is absent or the merge fails
     */
    AnalysisResult merge(const AnalysisResult &local, const std::optional<RemoteResult> &remote) const;

    double remoteWeight() const { return remote_weight_; }

private:
    double blend(double remote_value, double local_value) const;

    CategoryClassifier classifier_;
    double remote_weight_;
};
