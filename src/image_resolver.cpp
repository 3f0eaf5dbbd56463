#include "core/image_resolver.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <utility>

bool splitUrl(const std::string &url, std::string &origin, std::string &path)
{
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0)
    {
        return false;
    }

    const auto host_start = scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == host_start)
    {
        return false;
    }

    if (path_start == std::string::npos)
    {
        origin = url;
        path = "/";
    }
    else
    {
        origin = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return origin.size() > host_start;
}

const char *toString(ResolveStatus status)
{
    switch (status)
    {
    case ResolveStatus::OK:
        return "ok";
    case ResolveStatus::NOT_FOUND:
        return "not found";
    case ResolveStatus::TIMEOUT:
        return "timeout";
    case ResolveStatus::TRANSPORT_ERROR:
        return "transport error";
    case ResolveStatus::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

HttpImageResolver::HttpImageResolver(StorageSettings settings)
    : settings_(std::move(settings))
{
}

std::string HttpImageResolver::urlFor(const std::string &locator) const
{
    if (locator.find("://") != std::string::npos || settings_.base_url.empty())
    {
        return locator;
    }

    std::string base = settings_.base_url;
    while (!base.empty() && base.back() == '/')
    {
        base.pop_back();
    }
    size_t key_start = 0;
    while (key_start < locator.size() && locator[key_start] == '/')
    {
        ++key_start;
    }
    return base + "/" + locator.substr(key_start);
}

ResolveResult HttpImageResolver::resolve(const ImageAsset &asset, const CancellationToken &cancel)
{
    ResolveResult result;
    result.image.asset = asset;

    if (cancel.isCancelled())
    {
        result.status = ResolveStatus::CANCELLED;
        result.error_message = "Cancelled before fetch";
        return result;
    }

    if (asset.source_locator.empty())
    {
        result.status = ResolveStatus::NOT_FOUND;
        result.error_message = "Image has no source locator: " + asset.original_filename;
        return result;
    }

    const std::string url = urlFor(asset.source_locator);
    std::string origin;
    std::string path;
    if (!splitUrl(url, origin, path))
    {
        result.status = ResolveStatus::TRANSPORT_ERROR;
        result.error_message = "Cannot resolve image locator (no storage base URL?): " + asset.source_locator;
        return result;
    }

    try
    {
        httplib::Client client(origin);
        if (!client.is_valid())
        {
            result.status = ResolveStatus::TRANSPORT_ERROR;
            result.error_message = "Unsupported image URL: " + url;
            return result;
        }
        client.set_connection_timeout(settings_.connect_timeout_seconds, 0);
        client.set_read_timeout(settings_.read_timeout_seconds, 0);
        client.set_follow_location(true);

        std::vector<uint8_t> body;
        bool too_large = false;
        auto res = client.Get(path, [&](const char *data, size_t length)
                              {
            if (cancel.isCancelled())
            {
                return false;
            }
            if (body.size() + length > settings_.max_download_bytes)
            {
                too_large = true;
                return false;
            }
            body.insert(body.end(), data, data + length);
            return true; });

        if (cancel.isCancelled())
        {
            result.status = ResolveStatus::CANCELLED;
            result.error_message = "Cancelled during fetch";
            return result;
        }

        if (!res)
        {
            const auto err = res.error();
            if (too_large)
            {
                result.status = ResolveStatus::TRANSPORT_ERROR;
                result.error_message = "Image exceeds max download size of " +
                                       std::to_string(settings_.max_download_bytes) + " bytes";
            }
            // Read timeouts surface as Error::Read
            else if (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read)
            {
                result.status = ResolveStatus::TIMEOUT;
                result.error_message = "Timed out fetching " + url + ": " + httplib::to_string(err);
            }
            else
            {
                result.status = ResolveStatus::TRANSPORT_ERROR;
                result.error_message = "Failed to fetch " + url + ": " + httplib::to_string(err);
            }
            Logger::warn(result.error_message);
            return result;
        }

        if (res->status == 404 || res->status == 410)
        {
            result.status = ResolveStatus::NOT_FOUND;
            result.error_message = "Image not found (HTTP " + std::to_string(res->status) + "): " + url;
            Logger::warn(result.error_message);
            return result;
        }
        if (res->status < 200 || res->status >= 300)
        {
            result.status = ResolveStatus::TRANSPORT_ERROR;
            result.error_message = "Unexpected HTTP " + std::to_string(res->status) + " fetching " + url;
            Logger::warn(result.error_message);
            return result;
        }

        result.status = ResolveStatus::OK;
        result.image.bytes = std::move(body);
        Logger::debug("Fetched " + std::to_string(result.image.bytes.size()) + " bytes for " + asset.original_filename);
    }
    catch (const std::exception &e)
    {
        result.status = ResolveStatus::TRANSPORT_ERROR;
        result.error_message = "Exception fetching " + url + ": " + e.what();
        Logger::error(result.error_message);
    }
    return result;
}
