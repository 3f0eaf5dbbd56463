#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/content_block.hpp"
#include "core/generation_settings.hpp"

enum class PackStatus
{
    OK,
    PAYLOAD_TOO_LARGE,
    CONTAINER_ERROR
};

struct PackResult
{
    PackStatus status = PackStatus::OK;
    std::vector<uint8_t> package;
    std::string error_message;
    size_t image_parts = 0;

    bool success() const { return status == PackStatus::OK; }
};

struct DocumentProperties
{
    std::string title;
    std::string subject = "Engineering Report";
    std::string creator = "Engineering Report Generator";
    std::string description = "Generated engineering report document";
    std::string created; // W3CDTF timestamp; empty means now
};

/**
 * @brief Serializes content blocks into a WordprocessingML (.docx) package.
 *
 * Every embedded ImageBlock becomes exactly one word/media/imageN.jpeg part
 * referenced from document.xml by relationship id rIdImgN. Reference and
 * unavailable images produce text only. A package larger than
 * max_package_bytes is reported as PAYLOAD_TOO_LARGE, never truncated.
 */
class DocumentPackager
{
public:
    explicit DocumentPackager(const GenerationSettings &settings = GenerationSettings{});

    PackResult pack(const std::vector<ContentBlock> &blocks, const DocumentProperties &properties = DocumentProperties{}) const;

    static std::string escapeXml(const std::string &text);

    // Display size in EMUs for an image fitted into the configured box
    void displayExtent(int width, int height, int64_t &cx, int64_t &cy) const;

private:
    GenerationSettings settings_;

    struct MediaPart
    {
        std::string part_name;
        std::string relationship_id;
        const std::vector<uint8_t> *bytes;
    };

    std::string documentXml(const std::vector<ContentBlock> &blocks, std::vector<MediaPart> &media) const;
    std::string imageBlockXml(const ImageBlock &block, std::vector<MediaPart> &media) const;
    static std::string contentTypesXml();
    static std::string packageRelsXml();
    static std::string documentRelsXml(const std::vector<MediaPart> &media);
    static std::string coreXml(const DocumentProperties &properties);
    static std::string appXml();
    static std::string stylesXml();
};
