#include "core/report_json.hpp"
#include "logging/logger.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace
{
    const char *LOCATOR_KEYS[] = {"publicUrl", "s3Url", "googleDriveUrl", "s3Key", "storageKey"};

    std::string stringField(const json &object, const char *key)
    {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string())
        {
            return "";
        }
        return it->get<std::string>();
    }

    bool boolField(const json &object, const char *key)
    {
        auto it = object.find(key);
        return it != object.end() && it->is_boolean() && it->get<bool>();
    }

    // Field values are normally strings; numbers and booleans are kept as their JSON text
    bool fieldText(const json &value, std::string &text)
    {
        if (value.is_string())
        {
            text = value.get<std::string>();
            return true;
        }
        if (value.is_number() || value.is_boolean())
        {
            text = value.dump();
            return true;
        }
        return false;
    }

    RequestParseResult invalid(const std::string &message)
    {
        RequestParseResult result;
        result.error_message = message;
        Logger::warn("Invalid generation request: " + message);
        return result;
    }
}

RequestParseResult parseGenerationRequest(const std::string &body)
{
    try
    {
        return parseGenerationRequest(json::parse(body));
    }
    catch (const json::parse_error &e)
    {
        return invalid(std::string("Malformed JSON: ") + e.what());
    }
}

RequestParseResult parseGenerationRequest(const json &body)
{
    if (!body.is_object())
    {
        return invalid("Request body must be a JSON object");
    }

    RequestParseResult result;
    GenerationRequest &request = result.request;

    request.model.title = stringField(body, "title");
    if (request.model.title.empty())
    {
        return invalid("title is required");
    }

    auto report_data = body.find("reportData");
    if (report_data == body.end() || !report_data->is_object())
    {
        return invalid("reportData must be an object");
    }
    for (auto section = report_data->begin(); section != report_data->end(); ++section)
    {
        if (!section.value().is_object())
        {
            continue;
        }
        auto &fields = request.model.sections[ReportSchema::canonicalSectionId(section.key())];
        for (auto field = section.value().begin(); field != section.value().end(); ++field)
        {
            std::string text;
            if (fieldText(field.value(), text))
            {
                fields[field.key()] = text;
            }
        }
    }

    auto images = body.find("images");
    if (images != body.end() && !images->is_null())
    {
        if (!images->is_array())
        {
            return invalid("images must be an array");
        }
        int index = 0;
        for (const auto &image : *images)
        {
            ++index;
            if (!image.is_object())
            {
                return invalid("images[" + std::to_string(index - 1) + "] must be an object");
            }

            ImageAsset asset;
            asset.original_filename = stringField(image, "originalFilename");
            if (asset.original_filename.empty())
            {
                return invalid("images[" + std::to_string(index - 1) + "].originalFilename is required");
            }

            auto size = image.find("fileSize");
            if (size == image.end() || !size->is_number() || size->get<double>() < 0)
            {
                return invalid("images[" + std::to_string(index - 1) + "].fileSize must be a non-negative number");
            }
            asset.declared_byte_size = static_cast<uint64_t>(size->get<double>());

            asset.id = stringField(image, "id");
            if (asset.id.empty())
            {
                asset.id = "image-" + std::to_string(index);
            }
            for (const char *key : LOCATOR_KEYS)
            {
                asset.source_locator = stringField(image, key);
                if (!asset.source_locator.empty())
                    break;
            }
            asset.mime_type = stringField(image, "mimeType");
            asset.description = stringField(image, "description");

            auto order = image.find("order");
            asset.order = (order != image.end() && order->is_number_integer()) ? order->get<int>() : index - 1;

            request.assets.push_back(std::move(asset));
        }
    }

    std::stable_sort(request.assets.begin(), request.assets.end(), [](const ImageAsset &a, const ImageAsset &b)
                     { return a.order < b.order; });

    request.options.embed_images_inline = boolField(body, "includePhotosInline");
    request.options.enhance_text = boolField(body, "aiEnhanceText");

    result.success = true;
    return result;
}

json toRemotePayload(const GenerationRequest &request)
{
    json report_data = json::object();
    for (const auto &section : request.model.sections)
    {
        json fields = json::object();
        for (const auto &field : section.second)
        {
            fields[field.first] = field.second;
        }
        report_data[section.first] = fields;
    }

    json images = json::array();
    for (const auto &asset : request.assets)
    {
        json image = {
            {"id", asset.id},
            {"originalFilename", asset.original_filename},
            {"fileSize", asset.declared_byte_size},
            {"order", asset.order}};
        if (asset.source_locator.find("://") != std::string::npos)
            image["publicUrl"] = asset.source_locator;
        else if (!asset.source_locator.empty())
            image["s3Key"] = asset.source_locator;
        if (!asset.description.empty())
            image["description"] = asset.description;
        if (!asset.mime_type.empty())
            image["mimeType"] = asset.mime_type;
        images.push_back(image);
    }

    return json{
        {"title", request.model.title},
        {"reportData", report_data},
        {"images", images},
        {"includePhotosInline", request.options.embed_images_inline},
        {"aiEnhanceText", request.options.enhance_text}};
}
