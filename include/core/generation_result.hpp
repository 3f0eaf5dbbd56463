#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/report_model.hpp"

/**
 * @brief Progress sink shared by every stage: percent in [0, 100] plus a stage message
 */
using ProgressCallback = std::function<void(double percent, const std::string &message)>;

enum class GenerationStrategy
{
    LOCAL,
    DELEGATED
};

enum class GenerationErrorKind
{
    NONE,
    INVALID_REQUEST,
    PAYLOAD_TOO_LARGE,
    DELEGATION,
    PACKAGING,
    CANCELLED,
    INTERNAL
};

/**
 * @brief Everything one generation run needs from the caller
 */
struct GenerationRequest
{
    ReportContentModel model;
    std::vector<ImageAsset> assets;
    GenerationOptions options;
};

/**
 * @brief Result of a generation run.
 *
 * On success package_bytes holds the .docx and strategy tells which path built
 * it. On failure error names the failure class; CANCELLED is kept distinct so
 * callers never auto-retry it.
 */
struct GenerationOutcome
{
    bool success = false;
    GenerationStrategy strategy = GenerationStrategy::LOCAL;
    GenerationErrorKind error = GenerationErrorKind::NONE;
    std::string error_message;
    std::vector<uint8_t> package_bytes;
    std::string suggested_filename;
    bool fallback_used = false;
    size_t embedded_images = 0;
    size_t unavailable_images = 0;

    static GenerationOutcome failure(GenerationErrorKind kind, const std::string &message)
    {
        GenerationOutcome outcome;
        outcome.error = kind;
        outcome.error_message = message;
        return outcome;
    }

    bool cancelled() const { return error == GenerationErrorKind::CANCELLED; }
};

const char *toString(GenerationStrategy strategy);
const char *toString(GenerationErrorKind kind);
