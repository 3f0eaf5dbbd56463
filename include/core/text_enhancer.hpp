#pragma once

#include <optional>
#include <string>
#include "core/cancellation_token.hpp"
#include "core/report_model.hpp"

/**
 * @brief Rewrites bullet-style field text into prose.
 * An empty optional means "keep the original text".
 */
class TextEnhancer
{
public:
    virtual ~TextEnhancer() = default;
    virtual std::optional<std::string> enhance(const std::string &text, const std::string &field_type) = 0;
};

struct TextEnhancementSettings
{
    std::string base_url; // Empty disables enhancement
    std::string path = "/api/ai/generate-text";
    int timeout_seconds = 30;
};

/**
 * @brief TextEnhancer backed by the paragraph generation HTTP endpoint.
 *
 * Request:  {"bulletPoints": ..., "fieldType": ..., "context": ...}
 * Response: {"generatedText": ...}
 */
class HttpTextEnhancer : public TextEnhancer
{
public:
    explicit HttpTextEnhancer(TextEnhancementSettings settings);

    std::optional<std::string> enhance(const std::string &text, const std::string &field_type) override;

private:
    TextEnhancementSettings settings_;
};

// True when any line of the text starts with a bullet or "N." marker
bool needsEnhancement(const std::string &text);

/**
 * @brief Copy of the model with list-like fields enhanced.
 *
 * Fields are processed in schema order; failures keep the original text and
 * cancellation stops further requests, leaving remaining fields untouched.
 */
ReportContentModel enhanceModel(const ReportContentModel &model, TextEnhancer &enhancer, const CancellationToken &cancel);
