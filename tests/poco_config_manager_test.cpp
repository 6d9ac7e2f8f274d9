#include <gtest/gtest.h>
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <filesystem>

class PocoConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");

        test_config_path_ = (std::filesystem::temp_directory_path() /
                             ("authscore_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".json"))
                                .string();
        createTestConfig();
    }

    void TearDown() override
    {
        if (std::filesystem::exists(test_config_path_))
        {
            std::filesystem::remove(test_config_path_);
        }
    }

    void createTestConfig()
    {
        std::ofstream config_file(test_config_path_);
        config_file << R"({
            "log_level": "DEBUG",
            "analysis": {
                "weights": {
                    "noise_analysis": 0.5,
                    "facial_features": 0
                }
            },
            "classification": {
                "likely_manipulated_min": 90,
                "potentially_manipulated_min": 70,
                "uncertain_min": 30,
                "deepfake_threshold": 75,
                "labels": {
                    "likely_authentic": "Authentic"
                }
            },
            "remote": {
                "enabled": true,
                "endpoint": "http://detector.internal:9000",
                "path": "/v2/score",
                "timeout_seconds": 2.5,
                "weight": 0.25
            },
            "upload": {
                "max_file_size_mb": 10,
                "accepted_mime_types": "image/png, Video/MP4"
            },
            "threading": {
                "max_analysis_threads": 2
            }
        })";
    }

    std::string test_config_path_;
};

TEST_F(PocoConfigManagerTest, DefaultsWithoutFile)
{
    PocoConfigManager config;

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getFeatureWeights(), CompositeScorer::defaultWeights());
    EXPECT_EQ(config.getMaxFileSizeMB(), 100u);
    EXPECT_EQ(config.getAcceptedMimeTypes(), MediaTypes::defaultAcceptedMimeTypes());
    EXPECT_EQ(config.getMaxAnalysisThreads(), 4);

    CategoryPolicy policy = config.getCategoryPolicy();
    ASSERT_EQ(policy.bands.size(), 4u);
    EXPECT_DOUBLE_EQ(policy.bands[0].lower_bound, 80.0);
    EXPECT_EQ(policy.bands[0].label, "Likely Manipulated");
    EXPECT_DOUBLE_EQ(policy.bands[2].lower_bound, 40.0);
    EXPECT_EQ(policy.bands[3].label, "Likely Authentic");
    EXPECT_DOUBLE_EQ(policy.deepfake_threshold, 60.0);

    RemoteDetectorOptions remote = config.getRemoteOptions();
    EXPECT_FALSE(remote.enabled);
    EXPECT_EQ(remote.endpoint, "http://localhost:8000");
    EXPECT_EQ(remote.path, "/predict/");
    EXPECT_EQ(remote.timeout, std::chrono::milliseconds(30000));
    EXPECT_DOUBLE_EQ(remote.weight, 0.6);

    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadsValuesFromFile)
{
    PocoConfigManager config;
    ASSERT_TRUE(config.load(test_config_path_));

    EXPECT_EQ(config.getLogLevel(), "DEBUG");

    auto weights = config.getFeatureWeights();
    EXPECT_DOUBLE_EQ(weights.at("noise_analysis"), 0.5);
    EXPECT_DOUBLE_EQ(weights.at("facial_features"), 0.0);
    // Keys missing from the file keep their defaults
    EXPECT_DOUBLE_EQ(weights.at("compression_artifacts"), 0.15);

    CategoryPolicy policy = config.getCategoryPolicy();
    EXPECT_DOUBLE_EQ(policy.bands[0].lower_bound, 90.0);
    EXPECT_DOUBLE_EQ(policy.bands[1].lower_bound, 70.0);
    EXPECT_DOUBLE_EQ(policy.bands[2].lower_bound, 30.0);
    EXPECT_EQ(policy.bands[1].label, "Potentially Manipulated");
    EXPECT_EQ(policy.bands[3].label, "Authentic");
    EXPECT_DOUBLE_EQ(policy.deepfake_threshold, 75.0);

    RemoteDetectorOptions remote = config.getRemoteOptions();
    EXPECT_TRUE(remote.enabled);
    EXPECT_EQ(remote.endpoint, "http://detector.internal:9000");
    EXPECT_EQ(remote.path, "/v2/score");
    EXPECT_EQ(remote.timeout, std::chrono::milliseconds(2500));
    EXPECT_DOUBLE_EQ(remote.weight, 0.25);

    EXPECT_EQ(config.getMaxFileSizeMB(), 10u);
    EXPECT_EQ(config.getAcceptedMimeTypes(), (std::vector<std::string>{"image/png", "video/mp4"}));
    EXPECT_EQ(config.getMaxAnalysisThreads(), 2);

    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadFailures)
{
    PocoConfigManager config;
    EXPECT_FALSE(config.load(test_config_path_ + ".missing"));

    {
        std::ofstream broken(test_config_path_);
        broken << "{ not json";
    }
    EXPECT_FALSE(config.load(test_config_path_));
    // A failed load keeps the previous configuration
    EXPECT_EQ(config.getLogLevel(), "INFO");
}

TEST_F(PocoConfigManagerTest, UpdateWithJsonPatch)
{
    PocoConfigManager config;
    config.update({{"log_level", "WARN"},
                   {"remote", {{"enabled", true}, {"weight", 0.8}}},
                   {"threading", {{"max_analysis_threads", 8}}}});

    EXPECT_EQ(config.getLogLevel(), "WARN");
    EXPECT_TRUE(config.getRemoteOptions().enabled);
    EXPECT_DOUBLE_EQ(config.getRemoteOptions().weight, 0.8);
    EXPECT_EQ(config.getMaxAnalysisThreads(), 8);
    EXPECT_TRUE(config.hasKey("remote.weight"));
    EXPECT_FALSE(config.hasKey("remote.unknown"));
}

TEST_F(PocoConfigManagerTest, SaveAndReload)
{
    PocoConfigManager config;
    config.update({{"classification", {{"deepfake_threshold", 55.5}}}});
    ASSERT_TRUE(config.save(test_config_path_));

    PocoConfigManager reloaded;
    ASSERT_TRUE(reloaded.load(test_config_path_));
    EXPECT_DOUBLE_EQ(reloaded.getCategoryPolicy().deepfake_threshold, 55.5);
    EXPECT_EQ(reloaded.getAll()["classification"]["labels"]["uncertain"], "Uncertain");
}

TEST_F(PocoConfigManagerTest, GetAllReturnsNestedJson)
{
    PocoConfigManager config;
    auto all = config.getAll();
    EXPECT_EQ(all["log_level"], "INFO");
    EXPECT_TRUE(all["analysis"]["weights"].is_object());
    EXPECT_EQ(all["remote"]["path"], "/predict/");
}

TEST_F(PocoConfigManagerTest, ValidationRejectsBadValues)
{
    {
        PocoConfigManager config;
        config.update({{"log_level", "VERBOSE"}});
        EXPECT_FALSE(config.validateConfig());
    }
    {
        PocoConfigManager config;
        config.update({{"classification", {{"uncertain_min", 70}}}});
        EXPECT_FALSE(config.validateConfig());
    }
    {
        PocoConfigManager config;
        config.update({{"remote", {{"weight", 1.5}}}});
        EXPECT_FALSE(config.validateConfig());
    }
    {
        PocoConfigManager config;
        config.update({{"analysis", {{"weights", {{"noise_analysis", -1.0}}}}}});
        EXPECT_FALSE(config.validateConfig());
    }
    {
        PocoConfigManager config;
        config.update({{"threading", {{"max_analysis_threads", 0}}}});
        EXPECT_FALSE(config.validateConfig());
    }
}

TEST_F(PocoConfigManagerTest, SplitHelper)
{
    EXPECT_EQ(split("a,b,,c", ','), (std::vector<std::string>{"a", "b", "", "c"}));
    EXPECT_TRUE(split("", ',').empty());
}
