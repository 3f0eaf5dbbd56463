#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "core/image_pipeline_orchestrator.hpp"
#include "test_support.hpp"

using namespace test_support;

class ImagePipelineOrchestratorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        resolver = std::make_shared<FakeImageResolver>();
        settings.inter_batch_delay_ms = 0;
        settings.batch_size = 3;
    }

    std::vector<ImageAsset> addImages(size_t count)
    {
        std::vector<ImageAsset> assets;
        for (size_t i = 0; i < count; ++i)
        {
            const std::string id = "img" + std::to_string(i);
            auto bytes = makeJpeg(60 + static_cast<int>(i) * 7, 40);
            resolver->add(id, bytes);
            assets.push_back(makeAsset(id, bytes.size(), static_cast<int>(i)));
        }
        return assets;
    }

    std::shared_ptr<FakeImageResolver> resolver;
    GenerationSettings settings;
};

TEST_F(ImagePipelineOrchestratorTest, OutputOrderMatchesInputUnderRandomDelays)
{
    resolver->setRandomDelay(25);
    auto assets = addImages(8);

    ImagePipelineOrchestrator pipeline(resolver, settings);
    PipelineResult result = pipeline.run(assets, true, nullptr, CancellationToken());

    ASSERT_FALSE(result.cancelled());
    ASSERT_EQ(result.images.size(), assets.size());
    for (size_t i = 0; i < assets.size(); ++i)
    {
        EXPECT_EQ(assetOf(result.images[i]).id, assets[i].id);
        const auto *embedded = std::get_if<EmbeddedImage>(&result.images[i]);
        ASSERT_NE(embedded, nullptr);
        EXPECT_EQ(embedded->width, 60 + static_cast<int>(i) * 7);
    }
    EXPECT_EQ(result.embedded_count, 8u);
    EXPECT_EQ(result.batches_run, 3u);
}

TEST_F(ImagePipelineOrchestratorTest, ReferencesSkipAllFetches)
{
    auto assets = addImages(4);

    ImagePipelineOrchestrator pipeline(resolver, settings);
    PipelineResult result = pipeline.run(assets, false, nullptr, CancellationToken());

    EXPECT_EQ(resolver->calls(), 0u);
    ASSERT_EQ(result.images.size(), 4u);
    for (const auto &image : result.images)
    {
        EXPECT_TRUE(std::holds_alternative<ImageReference>(image));
    }
}

TEST_F(ImagePipelineOrchestratorTest, FailuresBecomeUnavailableWithReason)
{
    auto assets = addImages(4);
    resolver->fail("img1", ResolveStatus::TIMEOUT);
    resolver->fail("img2", ResolveStatus::TRANSPORT_ERROR);
    assets.push_back(makeAsset("missing", 1000, 4));

    ImagePipelineOrchestrator pipeline(resolver, settings);
    PipelineResult result = pipeline.run(assets, true, nullptr, CancellationToken());

    ASSERT_EQ(result.images.size(), 5u);
    EXPECT_EQ(result.embedded_count, 2u);
    EXPECT_EQ(result.unavailable_count, 3u);

    auto reasonAt = [&result](size_t index)
    {
        return std::get<UnavailableImage>(result.images[index]).reason;
    };
    EXPECT_TRUE(std::holds_alternative<EmbeddedImage>(result.images[0]));
    EXPECT_EQ(reasonAt(1), UnavailableReason::TIMEOUT);
    EXPECT_EQ(reasonAt(2), UnavailableReason::TRANSPORT_ERROR);
    EXPECT_TRUE(std::holds_alternative<EmbeddedImage>(result.images[3]));
    EXPECT_EQ(reasonAt(4), UnavailableReason::NOT_FOUND);
}

TEST_F(ImagePipelineOrchestratorTest, CancelledBeforeStartReturnsNothing)
{
    auto assets = addImages(3);
    CancellationToken cancel;
    cancel.cancel();

    ImagePipelineOrchestrator pipeline(resolver, settings);
    PipelineResult result = pipeline.run(assets, true, nullptr, cancel);

    EXPECT_TRUE(result.cancelled());
    EXPECT_TRUE(result.images.empty());
    EXPECT_EQ(resolver->calls(), 0u);
}

TEST_F(ImagePipelineOrchestratorTest, CancelInFirstBatchSkipsLaterBatches)
{
    settings.batch_size = 2;
    auto assets = addImages(6);
    CancellationToken cancel;
    resolver->cancelAfter(1, cancel);

    ImagePipelineOrchestrator pipeline(resolver, settings);
    PipelineResult result = pipeline.run(assets, true, nullptr, cancel);

    EXPECT_TRUE(result.cancelled());
    EXPECT_TRUE(result.images.empty());
    EXPECT_LE(resolver->calls(), 2u);
}

TEST_F(ImagePipelineOrchestratorTest, ProgressCoversAssignedRange)
{
    settings.batch_size = 2;
    auto assets = addImages(5);

    std::vector<double> percents;
    ImagePipelineOrchestrator pipeline(resolver, settings);
    pipeline.run(
        assets, true, [&percents](double percent, const std::string &)
        { percents.push_back(percent); },
        CancellationToken(), 20.0, 60.0);

    ASSERT_EQ(percents.size(), 3u);
    EXPECT_DOUBLE_EQ(percents[0], 40.0);
    EXPECT_DOUBLE_EQ(percents[1], 60.0);
    EXPECT_DOUBLE_EQ(percents[2], 80.0);
}

TEST_F(ImagePipelineOrchestratorTest, EmptyAssetListCompletes)
{
    ImagePipelineOrchestrator pipeline(resolver, settings);
    PipelineResult result = pipeline.run({}, true, nullptr, CancellationToken());

    EXPECT_FALSE(result.cancelled());
    EXPECT_TRUE(result.images.empty());
    EXPECT_EQ(result.batches_run, 0u);
}
