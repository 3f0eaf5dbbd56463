#include "core/image_reencoder.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

namespace
{
    UnavailableImage unavailable(const ImageAsset &asset, UnavailableReason reason, const std::string &detail)
    {
        Logger::warn("Image unavailable (" + toString(reason) + "): " + asset.original_filename + " - " + detail);
        return UnavailableImage{asset, reason, detail};
    }
}

ImageReencoder::ImageReencoder(const GenerationSettings &settings)
    : settings_(settings)
{
}

bool ImageReencoder::isJpeg(const std::vector<uint8_t> &bytes)
{
    return bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF;
}

bool ImageReencoder::isPng(const std::vector<uint8_t> &bytes)
{
    static const uint8_t signature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    return bytes.size() >= 8 && std::equal(signature, signature + 8, bytes.begin());
}

bool ImageReencoder::probeJpegDimensions(const std::vector<uint8_t> &bytes, int &width, int &height)
{
    if (!isJpeg(bytes))
    {
        return false;
    }

    size_t pos = 2;
    while (pos + 1 < bytes.size())
    {
        if (bytes[pos] != 0xFF)
        {
            return false;
        }
        // Skip fill bytes
        while (pos < bytes.size() && bytes[pos] == 0xFF)
        {
            ++pos;
        }
        if (pos >= bytes.size())
        {
            return false;
        }

        const uint8_t marker = bytes[pos++];
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8))
        {
            continue; // Standalone markers carry no length
        }
        if (marker == 0xD9 || marker == 0xDA)
        {
            return false; // Reached scan data or end of image without a frame header
        }
        if (pos + 2 > bytes.size())
        {
            return false;
        }

        const size_t length = (static_cast<size_t>(bytes[pos]) << 8) | bytes[pos + 1];
        if (length < 2 || pos + length > bytes.size())
        {
            return false;
        }

        const bool is_sof = marker >= 0xC0 && marker <= 0xCF &&
                            marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (is_sof)
        {
            if (length < 7)
            {
                return false;
            }
            height = (bytes[pos + 3] << 8) | bytes[pos + 4];
            width = (bytes[pos + 5] << 8) | bytes[pos + 6];
            return width > 0 && height > 0;
        }
        pos += length;
    }
    return false;
}

double ImageReencoder::scaleFactor(int width, int height) const
{
    if (width <= 0 || height <= 0)
    {
        return 1.0;
    }
    return std::min({static_cast<double>(settings_.max_image_width) / width,
                     static_cast<double>(settings_.max_image_height) / height,
                     1.0});
}

cv::Mat ImageReencoder::compositeOnWhite(const cv::Mat &bgra)
{
    std::vector<cv::Mat> channels;
    cv::split(bgra, channels);

    cv::Mat alpha;
    channels[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
    cv::Mat alpha3;
    cv::merge(std::vector<cv::Mat>{alpha, alpha, alpha}, alpha3);
    cv::Mat inverse_alpha3;
    cv::subtract(cv::Scalar::all(1.0), alpha3, inverse_alpha3);

    cv::Mat bgr;
    cv::merge(std::vector<cv::Mat>{channels[0], channels[1], channels[2]}, bgr);
    cv::Mat bgr_f;
    bgr.convertTo(bgr_f, CV_32FC3);

    cv::Mat white(bgr_f.size(), CV_32FC3, cv::Scalar::all(255.0));
    cv::Mat blended = bgr_f.mul(alpha3) + white.mul(inverse_alpha3);

    cv::Mat result;
    blended.convertTo(result, CV_8UC3);
    return result;
}

bool ImageReencoder::decode(const std::vector<uint8_t> &bytes, cv::Mat &image, std::string &error) const
{
    // PNGs may carry transparency; everything else is decoded with EXIF orientation applied
    const int flags = isPng(bytes) ? cv::IMREAD_UNCHANGED : cv::IMREAD_COLOR;
    cv::Mat decoded = cv::imdecode(bytes, flags);
    if (decoded.empty())
    {
        error = "Unsupported or corrupt image data";
        return false;
    }

    if (decoded.depth() == CV_16U)
    {
        decoded.convertTo(decoded, CV_8U, 1.0 / 256.0);
    }
    else if (decoded.depth() != CV_8U)
    {
        decoded.convertTo(decoded, CV_8U, 255.0);
    }

    switch (decoded.channels())
    {
    case 1:
        cv::cvtColor(decoded, image, cv::COLOR_GRAY2BGR);
        return true;
    case 3:
        image = decoded;
        return true;
    case 4:
        image = compositeOnWhite(decoded);
        return true;
    default:
        error = "Unsupported channel layout: " + std::to_string(decoded.channels()) + " channels";
        return false;
    }
}

ImageOutcome ImageReencoder::reencode(const ResolvedImage &resolved) const
{
    const ImageAsset &asset = resolved.asset;
    const auto &bytes = resolved.bytes;

    if (bytes.empty())
    {
        return unavailable(asset, UnavailableReason::DECODE_ERROR, "Empty image data");
    }

    int width = 0;
    int height = 0;
    if (bytes.size() <= settings_.max_embed_size_bytes && probeJpegDimensions(bytes, width, height) &&
        width <= settings_.max_image_width && height <= settings_.max_image_height)
    {
        Logger::debug("Passing through compliant JPEG: " + asset.original_filename);
        return EmbeddedImage{asset, bytes, width, height};
    }

    try
    {
        cv::Mat image;
        std::string error;
        if (!decode(bytes, image, error))
        {
            return unavailable(asset, UnavailableReason::DECODE_ERROR, error);
        }

        const double factor = scaleFactor(image.cols, image.rows);
        if (factor < 1.0)
        {
            const int target_width = std::max(1, static_cast<int>(std::lround(image.cols * factor)));
            const int target_height = std::max(1, static_cast<int>(std::lround(image.rows * factor)));
            cv::Mat resized;
            cv::resize(image, resized, cv::Size(target_width, target_height), 0, 0, cv::INTER_AREA);
            image = resized;
        }

        std::vector<uint8_t> encoded;
        for (int quality = settings_.jpeg_quality; quality >= settings_.min_jpeg_quality; quality -= 10)
        {
            encoded.clear();
            if (!cv::imencode(".jpg", image, encoded, {cv::IMWRITE_JPEG_QUALITY, quality}))
            {
                return unavailable(asset, UnavailableReason::ENCODE_ERROR, "JPEG encoder rejected image");
            }
            if (encoded.size() <= settings_.max_embed_size_bytes)
            {
                Logger::debug("Re-encoded " + asset.original_filename + " to " +
                              std::to_string(image.cols) + "x" + std::to_string(image.rows) +
                              " at quality " + std::to_string(quality) + " (" +
                              std::to_string(encoded.size()) + " bytes)");
                return EmbeddedImage{asset, std::move(encoded), image.cols, image.rows};
            }
        }

        return unavailable(asset, UnavailableReason::ENCODE_ERROR,
                           "Encoded image still exceeds " + std::to_string(settings_.max_embed_size_bytes) + " bytes");
    }
    catch (const cv::Exception &e)
    {
        return unavailable(asset, UnavailableReason::DECODE_ERROR, std::string("OpenCV error: ") + e.what());
    }
    catch (const std::exception &e)
    {
        return unavailable(asset, UnavailableReason::ENCODE_ERROR, e.what());
    }
}
