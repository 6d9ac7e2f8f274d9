#include <gtest/gtest.h>
#include "core/remote_detector_client.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>

class RemoteDetectorClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");

        server_.Post("/predict/", [this](const httplib::Request &req, httplib::Response &res)
                     {
                         ++requests_;
                         if (req.has_file("file"))
                         {
                             const auto file = req.get_file_value("file");
                             std::lock_guard<std::mutex> lock(received_mutex_);
                             received_content_ = file.content;
                             received_content_type_ = file.content_type;
                         }
                         res.set_content(R"({"score": 88.5, "analysis_details": {"facial_features": 91, "model": "v2"}})",
                                         "application/json"); });
        server_.Post("/broken", [](const httplib::Request &, httplib::Response &res)
                     { res.set_content("not json", "text/plain"); });
        server_.Post("/no-score", [](const httplib::Request &, httplib::Response &res)
                     { res.set_content(R"({"analysis_details": {}})", "application/json"); });
        server_.Post("/error", [](const httplib::Request &, httplib::Response &res)
                     {
                         res.status = 503;
                         res.set_content(R"({"score": 10})", "application/json"); });
        server_.Post("/slow", [](const httplib::Request &, httplib::Response &res)
                     {
                         std::this_thread::sleep_for(std::chrono::milliseconds(1000));
                         res.set_content(R"({"score": 10})", "application/json"); });

        server_.Post("/slow-once", [this](const httplib::Request &, httplib::Response &res)
                     {
                         if (slow_once_calls_.fetch_add(1) == 0)
                         {
                             std::this_thread::sleep_for(std::chrono::milliseconds(1000));
                         }
                         res.set_content(R"({"score": 42})", "application/json"); });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this]()
                                     { server_.listen_after_bind(); });

        for (int i = 0; i < 200 && !server_.is_running(); ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(server_.is_running());
    }

    void TearDown() override
    {
        server_.stop();
        if (server_thread_.joinable())
        {
            server_thread_.join();
        }
    }

    RemoteDetectorOptions optionsFor(const std::string &path, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) const
    {
        RemoteDetectorOptions options;
        options.enabled = true;
        options.endpoint = "http://127.0.0.1:" + std::to_string(port_);
        options.path = path;
        options.timeout = timeout;
        return options;
    }

    httplib::Server server_;
    std::thread server_thread_;
    int port_ = 0;
    std::atomic<int> requests_{0};
    std::atomic<int> slow_once_calls_{0};
    std::mutex received_mutex_;
    std::string received_content_;
    std::string received_content_type_;
    const std::string payload_ = std::string("\xFF\xD8 image bytes \xFF\xD9", 17);
};

TEST_F(RemoteDetectorClientTest, PostsMultipartAndParsesScore)
{
    RemoteDetectorClient client(optionsFor("/predict/"));
    auto result = client.fetch(payload_, "image/jpeg");

    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->score, 88.5);
    ASSERT_EQ(result->analysis_details.count("facial_features"), 1u);
    EXPECT_DOUBLE_EQ(result->analysis_details.at("facial_features"), 91.0);
    EXPECT_EQ(result->analysis_details.count("model"), 0u);

    EXPECT_EQ(requests_.load(), 1);
    std::lock_guard<std::mutex> lock(received_mutex_);
    EXPECT_EQ(received_content_, payload_);
    EXPECT_EQ(received_content_type_, "image/jpeg");
}

TEST_F(RemoteDetectorClientTest, FetchWithTimeoutReturnsResultWhenFast)
{
    RemoteDetectorClient client(optionsFor("/predict/"));
    auto result = client.fetchWithTimeout(payload_, "image/jpeg");
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->score, 88.5);
}

TEST_F(RemoteDetectorClientTest, NonSuccessStatusIsUnavailable)
{
    RemoteDetectorClient client(optionsFor("/error"));
    EXPECT_FALSE(client.fetch(payload_, "image/jpeg").has_value());
}

TEST_F(RemoteDetectorClientTest, MalformedBodyIsUnavailable)
{
    RemoteDetectorClient broken(optionsFor("/broken"));
    EXPECT_FALSE(broken.fetch(payload_, "image/jpeg").has_value());

    RemoteDetectorClient no_score(optionsFor("/no-score"));
    EXPECT_FALSE(no_score.fetch(payload_, "image/jpeg").has_value());
}

TEST_F(RemoteDetectorClientTest, UnknownPathIsUnavailable)
{
    RemoteDetectorClient client(optionsFor("/missing"));
    EXPECT_FALSE(client.fetch(payload_, "image/jpeg").has_value());
}

TEST_F(RemoteDetectorClientTest, UnreachableEndpointIsUnavailable)
{
    RemoteDetectorOptions options = optionsFor("/predict/", std::chrono::milliseconds(300));
    options.endpoint = "http://127.0.0.1:1";
    RemoteDetectorClient client(options);
    EXPECT_FALSE(client.fetchWithTimeout(payload_, "image/jpeg").has_value());
}

TEST_F(RemoteDetectorClientTest, SlowDetectorTimesOut)
{
    RemoteDetectorClient client(optionsFor("/slow", std::chrono::milliseconds(150)));

    auto start = std::chrono::steady_clock::now();
    auto result = client.fetchWithTimeout(payload_, "image/jpeg");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.has_value());
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST_F(RemoteDetectorClientTest, ClientStaysUsableAfterTimeout)
{
    RemoteDetectorClient client(optionsFor("/slow-once", std::chrono::milliseconds(300)));

    EXPECT_FALSE(client.fetchWithTimeout(payload_, "image/jpeg").has_value());
    EXPECT_FALSE(client.isCancelled());

    auto result = client.fetchWithTimeout(payload_, "image/jpeg");
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->score, 42.0);
    EXPECT_EQ(slow_once_calls_.load(), 2);
}

TEST_F(RemoteDetectorClientTest, CancelAbortsInFlightRequest)
{
    RemoteDetectorClient client(optionsFor("/slow", std::chrono::milliseconds(5000)));
    auto pending = std::async(std::launch::async, [&]()
                              { return client.fetch(payload_, "image/jpeg"); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    client.cancel();

    EXPECT_FALSE(pending.get().has_value());
    EXPECT_TRUE(client.isCancelled());

    // A cancelled client stays cancelled
    EXPECT_FALSE(client.fetch(payload_, "image/jpeg").has_value());
}

TEST_F(RemoteDetectorClientTest, ParseResponse)
{
    auto parsed = RemoteDetectorClient::parseResponse(R"({"score": 12.5})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_DOUBLE_EQ(parsed->score, 12.5);

    EXPECT_FALSE(RemoteDetectorClient::parseResponse("[1, 2]").has_value());
    EXPECT_FALSE(RemoteDetectorClient::parseResponse(R"({"score": "high"})").has_value());
    EXPECT_FALSE(RemoteDetectorClient::parseResponse("").has_value());
}
