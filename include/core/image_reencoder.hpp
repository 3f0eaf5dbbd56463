#pragma once

#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>
#include "core/content_block.hpp"
#include "core/generation_settings.hpp"
#include "core/image_resolver.hpp"

/**
 * @brief Turns fetched image bytes into an embeddable JPEG.
 *
 * Pass-through rule: bytes within max_embed_size_bytes that are already JPEG
 * (with a readable frame header) and already fit max_image_width x
 * max_image_height are returned unchanged. Everything else is
 * decoded, scaled to fit max_image_width x max_image_height and re-encoded as
 * JPEG. Failures become UnavailableImage; nothing is thrown.
 */
class ImageReencoder
{
public:
    explicit ImageReencoder(const GenerationSettings &settings = GenerationSettings{});

    /**
     * @brief Produce the terminal state for one resolved image
     * @return EmbeddedImage or UnavailableImage, never ImageReference
     */
    ImageOutcome reencode(const ResolvedImage &resolved) const;

    static bool isJpeg(const std::vector<uint8_t> &bytes);
    static bool isPng(const std::vector<uint8_t> &bytes);

    /**
     * @brief Read width/height from the first JPEG start-of-frame segment
     */
    static bool probeJpegDimensions(const std::vector<uint8_t> &bytes, int &width, int &height);

    // Scale factor used to fit width x height inside the configured box (never upscales)
    double scaleFactor(int width, int height) const;

private:
    GenerationSettings settings_;

    bool decode(const std::vector<uint8_t> &bytes, cv::Mat &image, std::string &error) const;
    static cv::Mat compositeOnWhite(const cv::Mat &bgra);
};
