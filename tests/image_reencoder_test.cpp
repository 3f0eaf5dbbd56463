#include <gtest/gtest.h>
#include <variant>
#include <vector>
#include <opencv2/imgcodecs.hpp>
#include "core/image_reencoder.hpp"
#include "test_support.hpp"

using namespace test_support;

class ImageReencoderTest : public ::testing::Test
{
protected:
    ResolvedImage resolved(std::vector<uint8_t> bytes)
    {
        ResolvedImage image;
        image.asset = makeAsset("photo");
        image.bytes = std::move(bytes);
        return image;
    }

    GenerationSettings settings;
};

TEST_F(ImageReencoderTest, SmallJpegPassesThroughUnchanged)
{
    auto jpeg = makeJpeg(320, 200);
    ImageReencoder reencoder(settings);

    ImageOutcome outcome = reencoder.reencode(resolved(jpeg));

    const auto *embedded = std::get_if<EmbeddedImage>(&outcome);
    ASSERT_NE(embedded, nullptr);
    EXPECT_EQ(embedded->encoded_bytes, jpeg);
    EXPECT_EQ(embedded->width, 320);
    EXPECT_EQ(embedded->height, 200);
}

TEST_F(ImageReencoderTest, OversizedJpegIsScaledIntoBox)
{
    auto jpeg = makeJpeg(1600, 900);
    settings.max_embed_size_bytes = jpeg.size() - 1;
    ImageReencoder reencoder(settings);

    ImageOutcome outcome = reencoder.reencode(resolved(jpeg));

    const auto *embedded = std::get_if<EmbeddedImage>(&outcome);
    ASSERT_NE(embedded, nullptr);
    EXPECT_EQ(embedded->width, 800);
    EXPECT_EQ(embedded->height, 450);
    EXPECT_LE(embedded->encoded_bytes.size(), settings.max_embed_size_bytes);
    EXPECT_TRUE(ImageReencoder::isJpeg(embedded->encoded_bytes));
}

TEST_F(ImageReencoderTest, SmallJpegOutsideBoxIsScaled)
{
    cv::Mat flat(900, 1600, CV_8UC3, cv::Scalar(90, 120, 150));
    std::vector<uint8_t> jpeg;
    ASSERT_TRUE(cv::imencode(".jpg", flat, jpeg));
    ASSERT_LE(jpeg.size(), settings.max_embed_size_bytes);
    ImageReencoder reencoder(settings);

    ImageOutcome outcome = reencoder.reencode(resolved(jpeg));

    const auto *embedded = std::get_if<EmbeddedImage>(&outcome);
    ASSERT_NE(embedded, nullptr);
    EXPECT_NE(embedded->encoded_bytes, jpeg);
    EXPECT_EQ(embedded->width, 800);
    EXPECT_EQ(embedded->height, 450);

    int width = 0;
    int height = 0;
    ASSERT_TRUE(ImageReencoder::probeJpegDimensions(embedded->encoded_bytes, width, height));
    EXPECT_EQ(width, 800);
    EXPECT_EQ(height, 450);
}

TEST_F(ImageReencoderTest, PngIsConvertedToJpeg)
{
    auto png = makePng(200, 100, false);
    ImageReencoder reencoder(settings);

    ImageOutcome outcome = reencoder.reencode(resolved(png));

    const auto *embedded = std::get_if<EmbeddedImage>(&outcome);
    ASSERT_NE(embedded, nullptr);
    EXPECT_TRUE(ImageReencoder::isJpeg(embedded->encoded_bytes));
    EXPECT_EQ(embedded->width, 200);
    EXPECT_EQ(embedded->height, 100);
}

TEST_F(ImageReencoderTest, TransparentPngIsFlattenedOnWhite)
{
    // Fully transparent pixels must come out white, not black
    cv::Mat transparent(50, 50, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    std::vector<uint8_t> png;
    ASSERT_TRUE(cv::imencode(".png", transparent, png));
    ImageReencoder reencoder(settings);

    ImageOutcome outcome = reencoder.reencode(resolved(png));

    const auto *embedded = std::get_if<EmbeddedImage>(&outcome);
    ASSERT_NE(embedded, nullptr);
    cv::Mat decoded = cv::imdecode(embedded->encoded_bytes, cv::IMREAD_COLOR);
    ASSERT_FALSE(decoded.empty());
    const cv::Vec3b center = decoded.at<cv::Vec3b>(25, 25);
    EXPECT_GT(center[0], 240);
    EXPECT_GT(center[1], 240);
    EXPECT_GT(center[2], 240);
}

TEST_F(ImageReencoderTest, CorruptBytesAreUnavailable)
{
    ImageReencoder reencoder(settings);

    ImageOutcome outcome = reencoder.reencode(resolved({'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'}));

    const auto *unavailable = std::get_if<UnavailableImage>(&outcome);
    ASSERT_NE(unavailable, nullptr);
    EXPECT_EQ(unavailable->reason, UnavailableReason::DECODE_ERROR);
    EXPECT_EQ(unavailable->asset.id, "photo");
}

TEST_F(ImageReencoderTest, EmptyBytesAreUnavailable)
{
    ImageReencoder reencoder(settings);
    ImageOutcome outcome = reencoder.reencode(resolved({}));
    EXPECT_TRUE(std::holds_alternative<UnavailableImage>(outcome));
}

TEST_F(ImageReencoderTest, TruncatedJpegHeaderIsNotPassedThrough)
{
    std::vector<uint8_t> truncated = {0xFF, 0xD8, 0xFF, 0xE0, 0x00};
    int width = 0;
    int height = 0;
    EXPECT_FALSE(ImageReencoder::probeJpegDimensions(truncated, width, height));

    ImageReencoder reencoder(settings);
    EXPECT_TRUE(std::holds_alternative<UnavailableImage>(reencoder.reencode(resolved(truncated))));
}

TEST_F(ImageReencoderTest, ProbeReadsFrameDimensions)
{
    auto jpeg = makeJpeg(123, 45);
    int width = 0;
    int height = 0;
    ASSERT_TRUE(ImageReencoder::probeJpegDimensions(jpeg, width, height));
    EXPECT_EQ(width, 123);
    EXPECT_EQ(height, 45);
}

TEST_F(ImageReencoderTest, SignatureChecks)
{
    EXPECT_TRUE(ImageReencoder::isJpeg(makeJpeg(8, 8)));
    EXPECT_FALSE(ImageReencoder::isJpeg(makePng(8, 8, false)));
    EXPECT_TRUE(ImageReencoder::isPng(makePng(8, 8, true)));
    EXPECT_FALSE(ImageReencoder::isPng({0x89, 'P', 'N'}));
}

TEST_F(ImageReencoderTest, ScaleFactorNeverUpscales)
{
    ImageReencoder reencoder(settings);
    EXPECT_DOUBLE_EQ(reencoder.scaleFactor(400, 300), 1.0);
    EXPECT_DOUBLE_EQ(reencoder.scaleFactor(1600, 1200), 0.5);
    EXPECT_DOUBLE_EQ(reencoder.scaleFactor(800, 1200), 0.5);
    EXPECT_DOUBLE_EQ(reencoder.scaleFactor(0, 0), 1.0);
}
