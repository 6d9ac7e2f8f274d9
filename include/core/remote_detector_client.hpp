#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include "core/analysis_result.hpp"
#include "core/media_types.hpp"

namespace httplib
{
    class Client;
}

/**
 * @brief Connection settings for the remote scoring endpoint
 */
struct RemoteDetectorOptions
{
    bool enabled = false;
    std::string endpoint = "http://localhost:8000"; // scheme://host:port
    std::string path = "/predict/";
    std::chrono::milliseconds timeout{30000};       // Bound on the whole exchange
    double weight = 0.6;                            // Share of the remote score when merging
};

/**
 * @brief Client for the optional remote detector
 *
 * Posts the buffer as multipart field "file" and parses
 * {score, analysis_details}. Every failure (transport error, timeout,
 * cancellation, non-2xx status, malformed body) is logged and reported as
 * std::nullopt. One instance serves one request at a time; cancel() may be
 * called from any thread.
 */
class RemoteDetectorClient
{
public:
    explicit RemoteDetectorClient(RemoteDetectorOptions options);
    ~RemoteDetectorClient();

    RemoteDetectorClient(const RemoteDetectorClient &) = delete;
    RemoteDetectorClient &operator=(const RemoteDetectorClient &) = delete;

    /**
     * @brief Blocking fetch, bounded by the transport timeouts
     */
    std::optional<RemoteResult> fetch(BufferView buffer, const std::string &mime_type);

    /**
     * @brief Fetch with a hard deadline of options.timeout
     *
     * An expired deadline aborts only the in-flight request. Later fetches on
     * the same instance are unaffected.
     */
    std::optional<RemoteResult> fetchWithTimeout(BufferView buffer, const std::string &mime_type);

    /**
     * @brief Abort the in-flight request (if any) and every later fetch on this instance
     */
    void cancel();

    bool isCancelled() const { return cancelled_.load(); }
    const RemoteDetectorOptions &options() const { return options_; }

    /**
     * @brief Parse a remote response body
     * @return RemoteResult, or std::nullopt when the body is not JSON or lacks a numeric score
     */
    static std::optional<RemoteResult> parseResponse(const std::string &body);

private:
    void stopActiveRequest();
    bool aborted() const;

    RemoteDetectorOptions options_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> deadline_expired_{false};

    std::mutex client_mutex_;
    httplib::Client *active_client_ = nullptr;
};
