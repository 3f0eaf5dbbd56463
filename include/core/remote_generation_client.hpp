#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/generation_result.hpp"

struct DelegationResult
{
    bool success = false;
    bool cancelled = false;
    std::vector<uint8_t> package_bytes;
    std::string error_message;
};

/**
 * @brief Hands a whole generation request to a remote service.
 *
 * The request is opaque to the caller; progress is reported in [0, 100] of the
 * delegated work and is only informational.
 */
class RemoteGenerationClient
{
public:
    virtual ~RemoteGenerationClient() = default;
    virtual DelegationResult generate(const GenerationRequest &request,
                                      const ProgressCallback &on_progress,
                                      const CancellationToken &cancel) = 0;
};

struct RemoteGenerationSettings
{
    std::string base_url; // Empty disables delegation
    std::string path = "/api/reports/generate-word";
    int timeout_seconds = 120;
};

/**
 * @brief RemoteGenerationClient over HTTP(S) using cpp-httplib.
 *
 * A binary reply is the package itself. A JSON reply carrying "downloadUrl"
 * is followed by a GET of that URL.
 */
class HttpRemoteGenerationClient : public RemoteGenerationClient
{
public:
    explicit HttpRemoteGenerationClient(RemoteGenerationSettings settings);

    DelegationResult generate(const GenerationRequest &request,
                              const ProgressCallback &on_progress,
                              const CancellationToken &cancel) override;

    bool isConfigured() const { return !settings_.base_url.empty(); }

private:
    RemoteGenerationSettings settings_;

    DelegationResult download(const std::string &url, const ProgressCallback &on_progress, const CancellationToken &cancel);
};
