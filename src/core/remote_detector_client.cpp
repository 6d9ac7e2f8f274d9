#include "core/remote_detector_client.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <future>
#include <utility>

namespace
{
    class ActiveClientRegistration
    {
    public:
        ActiveClientRegistration(std::mutex &mutex, httplib::Client *&slot, httplib::Client *client)
            : mutex_(mutex), slot_(slot)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot_ = client;
        }

        ~ActiveClientRegistration()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot_ = nullptr;
        }

    private:
        std::mutex &mutex_;
        httplib::Client *&slot_;
    };
}

RemoteDetectorClient::RemoteDetectorClient(RemoteDetectorOptions options)
    : options_(std::move(options))
{
}

RemoteDetectorClient::~RemoteDetectorClient() = default;

void RemoteDetectorClient::cancel()
{
    cancelled_.store(true);
    stopActiveRequest();
}

void RemoteDetectorClient::stopActiveRequest()
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (active_client_)
    {
        active_client_->stop();
    }
}

bool RemoteDetectorClient::aborted() const
{
    return cancelled_.load() || deadline_expired_.load();
}

std::optional<RemoteResult> RemoteDetectorClient::parseResponse(const std::string &body)
{
    try
    {
        auto parsed = nlohmann::json::parse(body);
        if (!parsed.is_object() || !parsed.contains("score") || !parsed.at("score").is_number())
        {
            Logger::warn("RemoteDetectorClient: response has no numeric score");
            return std::nullopt;
        }
        return parsed.get<RemoteResult>();
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("RemoteDetectorClient: malformed response: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<RemoteResult> RemoteDetectorClient::fetch(BufferView buffer, const std::string &mime_type)
{
    if (aborted())
    {
        Logger::warn("RemoteDetectorClient: client cancelled, request not sent");
        return std::nullopt;
    }

    try
    {
        httplib::Client client(options_.endpoint);
        client.set_connection_timeout(options_.timeout);
        client.set_read_timeout(options_.timeout);
        client.set_write_timeout(options_.timeout);

        // Unregistered before client is destroyed, so cancel() never sees a dangling pointer
        ActiveClientRegistration registration(client_mutex_, active_client_, &client);
        if (aborted())
        {
            Logger::warn("RemoteDetectorClient: request cancelled before sending");
            return std::nullopt;
        }

        httplib::MultipartFormDataItems items = {
            {"file", std::string(reinterpret_cast<const char *>(buffer.data), buffer.size), "upload", mime_type}};

        Logger::debug("RemoteDetectorClient: POST " + options_.endpoint + options_.path +
                      " (" + std::to_string(buffer.size) + " bytes)");
        auto response = client.Post(options_.path, items);

        if (aborted())
        {
            Logger::warn("RemoteDetectorClient: request cancelled");
            return std::nullopt;
        }
        if (!response)
        {
            Logger::warn("RemoteDetectorClient: request failed: " + httplib::to_string(response.error()));
            return std::nullopt;
        }
        if (response->status < 200 || response->status >= 300)
        {
            Logger::warn("RemoteDetectorClient: remote detector returned HTTP " + std::to_string(response->status));
            return std::nullopt;
        }

        return parseResponse(response->body);
    }
    catch (const std::exception &e)
    {
        Logger::warn("RemoteDetectorClient: request error: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<RemoteResult> RemoteDetectorClient::fetchWithTimeout(BufferView buffer, const std::string &mime_type)
{
    deadline_expired_.store(false);
    auto pending = std::async(std::launch::async, [this, buffer, &mime_type]()
                              { return fetch(buffer, mime_type); });

    if (pending.wait_for(options_.timeout) != std::future_status::ready)
    {
        Logger::warn("RemoteDetectorClient: no response within " + std::to_string(options_.timeout.count()) +
                     " ms, continuing with local result");
        // Abort only this request; the client stays usable for the next one
        deadline_expired_.store(true);
        stopActiveRequest();
        pending.wait();
        deadline_expired_.store(false);
        return std::nullopt;
    }

    return pending.get();
}
