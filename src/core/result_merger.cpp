#include "core/result_merger.hpp"
#include "core/composite_scorer.hpp"
#include "logging/logger.hpp"
#include <array>
#include <exception>
#include <utility>

ResultMerger::ResultMerger() : remote_weight_(kDefaultRemoteWeight)
{
}

ResultMerger::ResultMerger(CategoryClassifier classifier, double remote_weight)
    : classifier_(std::move(classifier)), remote_weight_(remote_weight)
{
    if (!(remote_weight_ >= 0.0 && remote_weight_ <= 1.0))
    {
        Logger::warn("ResultMerger: remote weight " + std::to_string(remote_weight_) +
                     " outside [0, 1], using " + std::to_string(kDefaultRemoteWeight));
        remote_weight_ = kDefaultRemoteWeight;
    }
}

double ResultMerger::blend(double remote_value, double local_value) const
{
    return FeatureExtractor::clampScore(remote_value) * remote_weight_ +
           local_value * (1.0 - remote_weight_);
}

AnalysisResult ResultMerger::merge(const AnalysisResult &local, const std::optional<RemoteResult> &remote) const
{
    if (!remote)
    {
        return local;
    }

    try
    {
        AnalysisResult merged = local;
        merged.score = FeatureExtractor::clampScore(CompositeScorer::roundToTenth(blend(remote->score, local.score)));
        merged.category = classifier_.categorize(merged.score);
        merged.is_deepfake = classifier_.isDeepfake(merged.score);

        static const std::array<const char *, 2> blended_features = {
            FeatureNames::FACIAL_FEATURES, FeatureNames::TEMPORAL_CONSISTENCY};
        for (const char *feature : blended_features)
        {
            auto remote_value = remote->analysis_details.find(feature);
            auto local_value = merged.feature_contributions.find(feature);
            if (remote_value == remote->analysis_details.end() || local_value == merged.feature_contributions.end())
                continue;

            local_value->second = FeatureExtractor::clampScore(blend(remote_value->second, local_value->second));
        }

        Logger::debug("ResultMerger: local " + std::to_string(local.score) + " + remote " +
                      std::to_string(remote->score) + " -> " + std::to_string(merged.score));
        return merged;
    }
    catch (const std::exception &e)
    {
        Logger::warn("ResultMerger: merge failed, keeping local result: " + std::string(e.what()));
        return local;
    }
}
