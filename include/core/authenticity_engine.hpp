#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "core/analysis_result.hpp"
#include "core/category_classifier.hpp"
#include "core/composite_scorer.hpp"
#include "core/feature_extractor.hpp"
#include "core/remote_detector_client.hpp"
#include "core/result_merger.hpp"

class PocoConfigManager;

/**
 * @brief Everything an engine needs; copied into the engine at creation
 */
struct EngineOptions
{
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    CompositeScorer::WeightTable weights = CompositeScorer::defaultWeights();
    CategoryPolicy category_policy = CategoryPolicy::defaults();
    RemoteDetectorOptions remote;
    Clock clock; // Source of AnalysisResult::timestamp; system_clock::now when empty

    static EngineOptions defaults();
    static EngineOptions fromConfig(const PocoConfigManager &config);
};

/**
 * @brief Local analysis pipeline: extractors, composite scorer, classifier, frame simulator
 *
 * An engine holds no mutable state after creation, so one instance can serve
 * any number of threads. Engines are created explicitly and owned by the
 * caller.
 */
class AuthenticityEngine
{
public:
    /**
     * @brief Build a ready engine
     */
    static std::unique_ptr<AuthenticityEngine> create(EngineOptions options = EngineOptions::defaults());

    /**
     * @brief Build an engine on a background thread
     */
    static std::future<std::unique_ptr<AuthenticityEngine>> createAsync(EngineOptions options = EngineOptions::defaults());

    AuthenticityEngine(const AuthenticityEngine &) = delete;
    AuthenticityEngine &operator=(const AuthenticityEngine &) = delete;

    /**
     * @brief Run the local pipeline; never throws for data
     * @param buffer Media bytes (may be empty)
     * @param mime_type Declared MIME type; parameters and case are ignored
     * @return Result with every score in [0, 100]; frame fields set only for video
     */
    AnalysisResult analyze(BufferView buffer, const std::string &mime_type) const;

    /**
     * @brief Local pipeline, then the remote detector (bounded by its timeout), then the merge
     *
     * Uses a fresh client built from the engine's remote options. When remote
     * scoring is disabled this is the same as analyze().
     */
    AnalysisResult analyzeWithRemote(BufferView buffer, const std::string &mime_type) const;

    /**
     * @brief Same as above with a caller-owned client, which the caller may cancel()
     */
    AnalysisResult analyzeWithRemote(BufferView buffer, const std::string &mime_type,
                                     RemoteDetectorClient &client) const;

    /**
     * @brief Score every feature; all features are neutral for unknown media types
     */
    FeatureSet extractFeatures(BufferView buffer, MediaFormat format) const;

    const std::vector<std::unique_ptr<FeatureExtractor>> &extractors() const { return extractors_; }
    const EngineOptions &options() const { return options_; }

private:
    explicit AuthenticityEngine(EngineOptions options);

    EngineOptions options_;
    std::vector<std::unique_ptr<FeatureExtractor>> extractors_;
    CompositeScorer scorer_;
    CategoryClassifier classifier_;
    ResultMerger merger_;
};
