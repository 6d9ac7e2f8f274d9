#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "core/category_classifier.hpp"
#include "core/composite_scorer.hpp"
#include "core/remote_detector_client.hpp"

/**
 * @brief JSON-backed configuration with typed getters
 *
 * Every getter falls back to a default, so a partial file (or no file at all)
 * still yields a usable configuration. One instance is created by the caller
 * and passed to whatever needs it.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    uint32_t getUInt32(const std::string &key, uint32_t def = 0) const;

    std::string getLogLevel() const;

    // Analysis configuration getters
    CompositeScorer::WeightTable getFeatureWeights() const;
    CategoryPolicy getCategoryPolicy() const;

    // Remote detector configuration
    RemoteDetectorOptions getRemoteOptions() const;

    // Upload configuration getters
    uint32_t getMaxFileSizeMB() const;
    std::vector<std::string> getAcceptedMimeTypes() const;

    // Thread configuration getters
    int getMaxAnalysisThreads() const;

    // Configuration validation
    bool validateConfig() const;

    // Utility methods
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
