#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/report_model.hpp"

enum class ResolveStatus
{
    OK,
    NOT_FOUND,
    TIMEOUT,
    TRANSPORT_ERROR,
    CANCELLED
};

struct ResolvedImage
{
    ImageAsset asset;
    std::vector<uint8_t> bytes;
    int width = 0; // 0 until decoded
    int height = 0;
};

struct ResolveResult
{
    ResolveStatus status = ResolveStatus::TRANSPORT_ERROR;
    ResolvedImage image;
    std::string error_message;

    bool success() const { return status == ResolveStatus::OK; }
};

/**
 * @brief Fetches the raw bytes behind an ImageAsset locator. No retries.
 */
class ImageResolver
{
public:
    virtual ~ImageResolver() = default;
    virtual ResolveResult resolve(const ImageAsset &asset, const CancellationToken &cancel) = 0;
};

struct StorageSettings
{
    std::string base_url; // Prefix for locators that are object-storage keys
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 30;
    uint64_t max_download_bytes = 10 * 1024 * 1024;
};

/**
 * @brief Resolver over HTTP(S) using cpp-httplib.
 *
 * Locators with a scheme are fetched as-is; any other locator is treated as a
 * storage key and appended to StorageSettings::base_url.
 */
class HttpImageResolver : public ImageResolver
{
public:
    explicit HttpImageResolver(StorageSettings settings);

    ResolveResult resolve(const ImageAsset &asset, const CancellationToken &cancel) override;

    std::string urlFor(const std::string &locator) const;

private:
    StorageSettings settings_;
};

/**
 * @brief Splits "scheme://host[:port]/path?query" into origin and path.
 * @return false when the URL has no scheme or host
 */
bool splitUrl(const std::string &url, std::string &origin, std::string &path);

const char *toString(ResolveStatus status);
