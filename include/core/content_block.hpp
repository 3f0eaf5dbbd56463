#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "core/report_model.hpp"

enum class UnavailableReason
{
    NOT_FOUND,
    TIMEOUT,
    TRANSPORT_ERROR,
    DECODE_ERROR,
    ENCODE_ERROR
};

/**
 * @brief Image bytes confirmed to fit the document's size and dimension budget
 */
struct EmbeddedImage
{
    ImageAsset asset;
    std::vector<uint8_t> encoded_bytes; // Always JPEG
    int width = 0;
    int height = 0;
};

struct UnavailableImage
{
    ImageAsset asset;
    UnavailableReason reason = UnavailableReason::TRANSPORT_ERROR;
    std::string detail;
};

// Reference-only image: rendered as filename, description and link
struct ImageReference
{
    ImageAsset asset;
};

// Exactly one terminal state per input asset
using ImageOutcome = std::variant<EmbeddedImage, UnavailableImage, ImageReference>;

const ImageAsset &assetOf(const ImageOutcome &outcome);
std::string toString(UnavailableReason reason);

struct HeadingBlock
{
    std::string text;
    int level = 1; // 0 = document title, 1 = section, 2 = field label
};

struct ParagraphBlock
{
    std::string text;
};

struct ImageBlock
{
    ImageOutcome image;
    size_t position = 0; // 1-based position in the report's image list
};

using ContentBlock = std::variant<HeadingBlock, ParagraphBlock, ImageBlock>;
