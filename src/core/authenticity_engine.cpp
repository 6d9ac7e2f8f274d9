#include "core/authenticity_engine.hpp"
#include "core/content_hash.hpp"
#include "core/frame_score_simulator.hpp"
#include "core/poco_config_manager.hpp"
#include "core/extractors/block_variance_extractor.hpp"
#include "core/extractors/compression_extractor.hpp"
#include "core/extractors/entropy_extractor.hpp"
#include "core/extractors/metadata_extractor.hpp"
#include "core/extractors/placeholder_extractor.hpp"
#include "logging/logger.hpp"
#include <sstream>
#include <utility>

EngineOptions EngineOptions::defaults()
{
    return EngineOptions();
}

EngineOptions EngineOptions::fromConfig(const PocoConfigManager &config)
{
    EngineOptions options;
    options.weights = config.getFeatureWeights();
    options.category_policy = config.getCategoryPolicy();
    options.remote = config.getRemoteOptions();
    return options;
}

std::unique_ptr<AuthenticityEngine> AuthenticityEngine::create(EngineOptions options)
{
    // Constructor is private, so std::make_unique cannot reach it
    return std::unique_ptr<AuthenticityEngine>(new AuthenticityEngine(std::move(options)));
}

std::future<std::unique_ptr<AuthenticityEngine>> AuthenticityEngine::createAsync(EngineOptions options)
{
    return std::async(std::launch::async, [options = std::move(options)]() mutable
                      { return create(std::move(options)); });
}

AuthenticityEngine::AuthenticityEngine(EngineOptions options)
    : options_(std::move(options)),
      scorer_(options_.weights),
      classifier_(options_.category_policy),
      merger_(classifier_, options_.remote.weight)
{
    if (!options_.clock)
    {
        options_.clock = []()
        { return std::chrono::system_clock::now(); };
    }

    // Registration order fixes the order features are computed and logged in
    extractors_.push_back(std::make_unique<EntropyExtractor>());
    extractors_.push_back(PlaceholderExtractor::facialFeatures());
    extractors_.push_back(std::make_unique<CompressionExtractor>());
    extractors_.push_back(PlaceholderExtractor::temporalConsistency());
    extractors_.push_back(std::make_unique<MetadataExtractor>());
    extractors_.push_back(std::make_unique<BlockVarianceExtractor>());
    extractors_.push_back(PlaceholderExtractor::edgeConsistency());
    extractors_.push_back(PlaceholderExtractor::colorDistribution());
    extractors_.push_back(PlaceholderExtractor::texturePatterns());
    extractors_.push_back(PlaceholderExtractor::frequencyAnalysis());
    extractors_.push_back(PlaceholderExtractor::statisticalMetrics());

    Logger::debug("AuthenticityEngine: created with " + std::to_string(extractors_.size()) + " feature extractors");
}

FeatureSet AuthenticityEngine::extractFeatures(BufferView buffer, MediaFormat format) const
{
    FeatureSet features;
    for (const auto &extractor : extractors_)
    {
        features[extractor->name()] = extractor->score(buffer, format);
    }
    return features;
}

AnalysisResult AuthenticityEngine::analyze(BufferView buffer, const std::string &mime_type) const
{
    const MediaFormat format = MediaTypes::fromMimeType(mime_type);

    AnalysisResult result;
    result.file_type = MediaTypes::kindOf(format);
    result.feature_contributions = extractFeatures(buffer, format);
    result.score = scorer_.score(result.feature_contributions);
    result.category = classifier_.categorize(result.score);
    result.is_deepfake = classifier_.isDeepfake(result.score);

    if (result.file_type == MediaKind::VIDEO)
    {
        auto frames = FrameScoreSimulator::simulate(result.score);
        result.frames_analyzed = static_cast<int>(frames.size());
        result.frame_scores = std::move(frames);
    }

    // Serialized timestamps carry milliseconds, so the result does too
    result.timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(options_.clock());

    if (format == MediaFormat::UNKNOWN)
    {
        Logger::warn("AuthenticityEngine: unrecognized media type '" + mime_type + "', all features neutral");
    }

    std::ostringstream summary;
    summary << "AuthenticityEngine: analyzed " << buffer.size << " bytes ("
            << MediaTypes::getFormatName(format) << ") score=" << result.score
            << " category='" << result.category << "'";
    Logger::info(summary.str());

    if (Logger::shouldLog(Logger::Level::DEBUG))
    {
        Logger::debug("AuthenticityEngine: content sha256 " + ContentHash::sha256Hex(buffer));
    }

    return result;
}

AnalysisResult AuthenticityEngine::analyzeWithRemote(BufferView buffer, const std::string &mime_type) const
{
    if (!options_.remote.enabled)
    {
        return analyze(buffer, mime_type);
    }

    RemoteDetectorClient client(options_.remote);
    return analyzeWithRemote(buffer, mime_type, client);
}

AnalysisResult AuthenticityEngine::analyzeWithRemote(BufferView buffer, const std::string &mime_type,
                                                     RemoteDetectorClient &client) const
{
    AnalysisResult local = analyze(buffer, mime_type);

    auto remote = client.fetchWithTimeout(buffer, MediaTypes::normalizeMimeType(mime_type));
    if (!remote)
    {
        Logger::info("AuthenticityEngine: remote detector unavailable, keeping local result");
        return local;
    }

    AnalysisResult merged = merger_.merge(local, remote);
    Logger::debug("AuthenticityEngine: merged local score " + std::to_string(local.score) +
                  " with remote score " + std::to_string(remote->score) + " -> " + std::to_string(merged.score));
    return merged;
}
