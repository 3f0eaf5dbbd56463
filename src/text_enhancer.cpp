#include "core/text_enhancer.hpp"
#include "core/image_resolver.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace
{
    const char *ENHANCEMENT_CONTEXT = "Civil engineering property inspection report";

    std::string lowercase(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }
}

bool needsEnhancement(const std::string &text)
{
    // Leading bullet (U+2022, '-', '*') or a numbered "N." marker
    static const std::regex pattern("^\\s*(?:\xE2\x80\xA2|-|\\*|\\d+\\.)");

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line))
    {
        if (std::regex_search(line, pattern))
        {
            return true;
        }
    }
    return false;
}

HttpTextEnhancer::HttpTextEnhancer(TextEnhancementSettings settings)
    : settings_(std::move(settings))
{
}

std::optional<std::string> HttpTextEnhancer::enhance(const std::string &text, const std::string &field_type)
{
    std::string origin;
    std::string base_path;
    if (!splitUrl(settings_.base_url, origin, base_path))
    {
        Logger::debug("Text enhancement endpoint not configured, keeping original text");
        return std::nullopt;
    }

    try
    {
        httplib::Client client(origin);
        client.set_connection_timeout(settings_.timeout_seconds, 0);
        client.set_read_timeout(settings_.timeout_seconds, 0);

        json request = {
            {"bulletPoints", text},
            {"fieldType", field_type},
            {"context", ENHANCEMENT_CONTEXT}};

        auto res = client.Post(settings_.path, request.dump(), "application/json");
        if (!res)
        {
            Logger::warn("Text enhancement for " + field_type + " failed: " + httplib::to_string(res.error()));
            return std::nullopt;
        }
        if (res->status < 200 || res->status >= 300)
        {
            Logger::warn("Text enhancement for " + field_type + " returned HTTP " + std::to_string(res->status));
            return std::nullopt;
        }

        auto body = json::parse(res->body);
        if (!body.contains("generatedText") || !body["generatedText"].is_string())
        {
            return std::nullopt;
        }
        auto generated = body["generatedText"].get<std::string>();
        if (generated.empty())
        {
            return std::nullopt;
        }
        return generated;
    }
    catch (const std::exception &e)
    {
        Logger::warn("Failed to enhance text for " + field_type + ", using original: " + e.what());
        return std::nullopt;
    }
}

ReportContentModel enhanceModel(const ReportContentModel &model, TextEnhancer &enhancer, const CancellationToken &cancel)
{
    ReportContentModel enhanced = model;
    size_t rewritten = 0;

    for (const auto &section : ReportSchema::sections())
    {
        auto section_it = enhanced.sections.find(section.id);
        if (section_it == enhanced.sections.end())
        {
            continue;
        }
        for (const auto &field : section.fields)
        {
            if (cancel.isCancelled())
            {
                Logger::info("Text enhancement cancelled after " + std::to_string(rewritten) + " fields");
                return enhanced;
            }

            auto field_it = section_it->second.find(field.key);
            if (field_it == section_it->second.end() || !needsEnhancement(field_it->second))
            {
                continue;
            }

            auto replacement = enhancer.enhance(field_it->second, lowercase(field.label));
            if (replacement)
            {
                field_it->second = *replacement;
                ++rewritten;
            }
        }
    }

    Logger::info("Enhanced " + std::to_string(rewritten) + " report fields");
    return enhanced;
}
