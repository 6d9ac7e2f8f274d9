#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/feature_extractor.hpp"
#include "core/media_types.hpp"

/**
 * @brief Outcome of one analysis call; a value type, never mutated after it is returned
 */
struct AnalysisResult
{
    double score;     // Composite score in [0, 100], one decimal
    std::string category;
    bool is_deepfake; // score >= deepfake threshold
    MediaKind file_type;
    FeatureSet feature_contributions;
    std::optional<std::vector<double>> frame_scores; // Video only
    std::optional<int> frames_analyzed;              // Video only, equals frame_scores->size()
    std::chrono::system_clock::time_point timestamp;

    AnalysisResult() : score(50.0), is_deepfake(false), file_type(MediaKind::IMAGE) {}

    bool operator==(const AnalysisResult &other) const;
    bool operator!=(const AnalysisResult &other) const { return !(*this == other); }
};

/**
 * @brief Score reported by the remote detector
 */
struct RemoteResult
{
    double score;
    std::map<std::string, double> analysis_details; // e.g. facial_features, temporal_consistency

    RemoteResult() : score(0.0) {}
    RemoteResult(double s, std::map<std::string, double> details = {})
        : score(s), analysis_details(std::move(details)) {}
};

/**
 * @brief ISO-8601 UTC timestamp with milliseconds ("2026-10-19T12:00:00.000Z")
 */
std::string formatTimestamp(const std::chrono::system_clock::time_point &time_point);

/**
 * @brief Parse formatTimestamp() output
 * @throws std::invalid_argument on malformed input
 */
std::chrono::system_clock::time_point parseTimestamp(const std::string &timestamp);

// nlohmann/json conversions
void to_json(nlohmann::json &j, const AnalysisResult &result);
void from_json(const nlohmann::json &j, AnalysisResult &result);
void to_json(nlohmann::json &j, const RemoteResult &result);
void from_json(const nlohmann::json &j, RemoteResult &result);
