#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/generation_result.hpp"

struct RequestParseResult
{
    bool success = false;
    GenerationRequest request;
    std::string error_message;
};

/**
 * @brief Reads the generate-word request body.
 *
 * Expected shape:
 *   {"title": "...", "reportData": {"<section>": {"<field>": "..."}},
 *    "images": [{"originalFilename", "fileSize", "publicUrl" | "s3Url" |
 *                "googleDriveUrl" | "s3Key", "description", "order", ...}],
 *    "includePhotosInline": bool, "aiEnhanceText": bool}
 *
 * Legacy section names are mapped to their canonical ids and images are
 * stably sorted by "order".
 */
RequestParseResult parseGenerationRequest(const nlohmann::json &body);
RequestParseResult parseGenerationRequest(const std::string &body);

// Request body sent to a remote generation service
nlohmann::json toRemotePayload(const GenerationRequest &request);
