#include "core/poco_config_manager.hpp"
#include "core/feature_extractor.hpp"
#include "core/media_types.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <cmath>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;

    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("PocoConfigManager: failed to parse " + path + ": " + e.displayText());
        return false;
    }
    cfg_ = tmp;
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

uint32_t PocoConfigManager::getUInt32(const std::string &key, uint32_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(cfg_->getUInt(key, def));
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

// Analysis configuration getters
CompositeScorer::WeightTable PocoConfigManager::getFeatureWeights() const
{
    CompositeScorer::WeightTable weights = CompositeScorer::defaultWeights();
    for (const auto &name : FeatureNames::all())
    {
        const std::string key = "analysis.weights." + name;
        if (hasKey(key))
        {
            weights[name] = getDouble(key, weights[name]);
        }
    }
    return weights;
}

CategoryPolicy PocoConfigManager::getCategoryPolicy() const
{
    const CategoryPolicy defaults = CategoryPolicy::defaults();

    CategoryPolicy policy;
    policy.bands = {
        {getDouble("classification.likely_manipulated_min", defaults.bands[0].lower_bound),
         getString("classification.labels.likely_manipulated", defaults.bands[0].label)},
        {getDouble("classification.potentially_manipulated_min", defaults.bands[1].lower_bound),
         getString("classification.labels.potentially_manipulated", defaults.bands[1].label)},
        {getDouble("classification.uncertain_min", defaults.bands[2].lower_bound),
         getString("classification.labels.uncertain", defaults.bands[2].label)},
        {defaults.bands[3].lower_bound,
         getString("classification.labels.likely_authentic", defaults.bands[3].label)}};
    policy.deepfake_threshold = getDouble("classification.deepfake_threshold", defaults.deepfake_threshold);
    return policy;
}

RemoteDetectorOptions PocoConfigManager::getRemoteOptions() const
{
    RemoteDetectorOptions options;
    options.enabled = getBool("remote.enabled", options.enabled);
    options.endpoint = getString("remote.endpoint", options.endpoint);
    options.path = getString("remote.path", options.path);

    const double timeout_seconds = getDouble("remote.timeout_seconds", 30.0);
    options.timeout = std::chrono::milliseconds(static_cast<long long>(std::llround(timeout_seconds * 1000.0)));
    options.weight = getDouble("remote.weight", options.weight);
    return options;
}

// Upload configuration getters
uint32_t PocoConfigManager::getMaxFileSizeMB() const
{
    return getUInt32("upload.max_file_size_mb", 100);
}

std::vector<std::string> PocoConfigManager::getAcceptedMimeTypes() const
{
    const std::string configured = getString("upload.accepted_mime_types", "");
    if (configured.empty())
        return MediaTypes::defaultAcceptedMimeTypes();

    std::vector<std::string> accepted;
    for (const auto &token : split(configured, ','))
    {
        std::string mime = MediaTypes::normalizeMimeType(token);
        if (!mime.empty())
            accepted.push_back(mime);
    }
    return accepted;
}

// Thread configuration getters
int PocoConfigManager::getMaxAnalysisThreads() const
{
    return getInt("threading.max_analysis_threads", 4);
}

// Configuration validation
bool PocoConfigManager::validateConfig() const
{
    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    for (const auto &entry : getFeatureWeights())
    {
        if (!std::isfinite(entry.second) || entry.second < 0.0)
        {
            Logger::error("Invalid weight for feature " + entry.first + ": " + std::to_string(entry.second));
            return false;
        }
    }

    CategoryPolicy policy = getCategoryPolicy();
    if (!policy.isValid())
    {
        Logger::error("Invalid classification bands: lower bounds must be strictly descending");
        return false;
    }

    if (policy.deepfake_threshold < 0.0 || policy.deepfake_threshold > 100.0)
    {
        Logger::error("Invalid deepfake threshold: " + std::to_string(policy.deepfake_threshold));
        return false;
    }

    RemoteDetectorOptions remote = getRemoteOptions();
    if (remote.weight < 0.0 || remote.weight > 1.0)
    {
        Logger::error("Invalid remote weight: " + std::to_string(remote.weight));
        return false;
    }

    if (remote.timeout.count() <= 0)
    {
        Logger::error("Invalid remote timeout: " + std::to_string(remote.timeout.count()) + "ms");
        return false;
    }

    if (getMaxFileSizeMB() == 0)
    {
        Logger::error("Invalid max file size: 0 MB");
        return false;
    }

    int threads = getMaxAnalysisThreads();
    if (threads <= 0 || threads > 256)
    {
        Logger::error("Invalid max analysis threads: " + std::to_string(threads));
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");

    // Feature weights
    for (const auto &entry : CompositeScorer::defaultWeights())
    {
        cfg_->setDouble("analysis.weights." + entry.first, entry.second);
    }

    // Classification bands
    cfg_->setDouble("classification.likely_manipulated_min", 80.0);
    cfg_->setDouble("classification.potentially_manipulated_min", 60.0);
    cfg_->setDouble("classification.uncertain_min", 40.0);
    cfg_->setDouble("classification.deepfake_threshold", 60.0);
    cfg_->setString("classification.labels.likely_manipulated", "Likely Manipulated");
    cfg_->setString("classification.labels.potentially_manipulated", "Potentially Manipulated");
    cfg_->setString("classification.labels.uncertain", "Uncertain");
    cfg_->setString("classification.labels.likely_authentic", "Likely Authentic");

    // Remote detector defaults
    cfg_->setBool("remote.enabled", false);
    cfg_->setString("remote.endpoint", "http://localhost:8000");
    cfg_->setString("remote.path", "/predict/");
    cfg_->setInt("remote.timeout_seconds", 30);
    cfg_->setDouble("remote.weight", 0.6);

    // Upload defaults
    cfg_->setUInt("upload.max_file_size_mb", 100);
    cfg_->setString("upload.accepted_mime_types", "image/jpeg,image/jpg,image/png,video/mp4,video/quicktime");

    // Threading defaults
    cfg_->setInt("threading.max_analysis_threads", 4);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
