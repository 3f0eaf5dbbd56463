#include "core/remote_generation_client.hpp"
#include "core/image_resolver.hpp"
#include "core/report_json.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace
{
    DelegationResult delegationError(const std::string &message)
    {
        DelegationResult result;
        result.error_message = message;
        Logger::error("Remote generation failed: " + message);
        return result;
    }

    DelegationResult delegationCancelled()
    {
        DelegationResult result;
        result.cancelled = true;
        result.error_message = "Remote generation cancelled";
        return result;
    }

    bool isJsonReply(const httplib::Response &res)
    {
        return res.get_header_value("Content-Type").find("application/json") != std::string::npos;
    }
}

HttpRemoteGenerationClient::HttpRemoteGenerationClient(RemoteGenerationSettings settings)
    : settings_(std::move(settings))
{
}

DelegationResult HttpRemoteGenerationClient::generate(const GenerationRequest &request,
                                                      const ProgressCallback &on_progress,
                                                      const CancellationToken &cancel)
{
    std::string origin;
    std::string base_path;
    if (!splitUrl(settings_.base_url, origin, base_path))
    {
        return delegationError("Remote generation service is not configured");
    }
    if (cancel.isCancelled())
    {
        return delegationCancelled();
    }

    try
    {
        httplib::Client client(origin);
        if (!client.is_valid())
        {
            return delegationError("Unsupported remote generation URL: " + settings_.base_url);
        }
        client.set_connection_timeout(settings_.timeout_seconds, 0);
        client.set_read_timeout(settings_.timeout_seconds, 0);
        client.set_follow_location(true);

        if (on_progress)
            on_progress(0.0, "Requesting document from generation service...");

        const std::string payload = toRemotePayload(request).dump();
        Logger::info("Delegating generation of '" + request.model.title + "' to " + origin + settings_.path);
        auto res = client.Post(settings_.path, payload, "application/json");

        if (cancel.isCancelled())
        {
            return delegationCancelled();
        }
        if (!res)
        {
            return delegationError("Request to " + origin + settings_.path + " failed: " + httplib::to_string(res.error()));
        }
        if (res->status < 200 || res->status >= 300)
        {
            return delegationError("Generation service returned HTTP " + std::to_string(res->status));
        }

        if (isJsonReply(*res))
        {
            auto body = json::parse(res->body);
            if (!body.contains("downloadUrl") || !body["downloadUrl"].is_string())
            {
                return delegationError("Generation service reply has no document and no downloadUrl");
            }
            std::string url = body["downloadUrl"].get<std::string>();
            if (url.find("://") == std::string::npos)
            {
                url = origin + (url.empty() || url.front() != '/' ? "/" : "") + url;
            }
            return download(url, on_progress, cancel);
        }

        if (res->body.empty())
        {
            return delegationError("Generation service returned an empty document");
        }

        DelegationResult result;
        result.success = true;
        result.package_bytes.assign(res->body.begin(), res->body.end());
        if (on_progress)
            on_progress(100.0, "Document received");
        Logger::info("Received " + std::to_string(result.package_bytes.size()) + " byte document from generation service");
        return result;
    }
    catch (const std::exception &e)
    {
        return delegationError(std::string("Exception during remote generation: ") + e.what());
    }
}

DelegationResult HttpRemoteGenerationClient::download(const std::string &url,
                                                      const ProgressCallback &on_progress,
                                                      const CancellationToken &cancel)
{
    std::string origin;
    std::string path;
    if (!splitUrl(url, origin, path))
    {
        return delegationError("Invalid download URL: " + url);
    }

    httplib::Client client(origin);
    if (!client.is_valid())
    {
        return delegationError("Unsupported download URL: " + url);
    }
    client.set_connection_timeout(settings_.timeout_seconds, 0);
    client.set_read_timeout(settings_.timeout_seconds, 0);
    client.set_follow_location(true);

    std::vector<uint8_t> body;
    auto res = client.Get(
        path,
        [&](const char *data, size_t length)
        {
            if (cancel.isCancelled())
                return false;
            body.insert(body.end(), data, data + length);
            return true;
        },
        [&](uint64_t current, uint64_t total)
        {
            if (on_progress && total > 0)
            {
                on_progress(100.0 * static_cast<double>(current) / static_cast<double>(total), "Downloading document...");
            }
            return !cancel.isCancelled();
        });

    if (cancel.isCancelled())
    {
        return delegationCancelled();
    }
    if (!res)
    {
        return delegationError("Download of " + url + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300)
    {
        return delegationError("Download of " + url + " returned HTTP " + std::to_string(res->status));
    }
    if (body.empty())
    {
        return delegationError("Downloaded document is empty");
    }

    DelegationResult result;
    result.success = true;
    result.package_bytes = std::move(body);
    Logger::info("Downloaded " + std::to_string(result.package_bytes.size()) + " byte document from " + origin);
    return result;
}
