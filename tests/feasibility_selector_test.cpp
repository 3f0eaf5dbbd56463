#include <gtest/gtest.h>
#include <vector>
#include "core/feasibility_selector.hpp"
#include "test_support.hpp"

using namespace test_support;

class FeasibilitySelectorTest : public ::testing::Test
{
protected:
    std::vector<ImageAsset> assetsOf(size_t count, uint64_t each)
    {
        std::vector<ImageAsset> assets;
        for (size_t i = 0; i < count; ++i)
        {
            assets.push_back(makeAsset("a" + std::to_string(i), each, static_cast<int>(i)));
        }
        return assets;
    }

    FeasibilitySelector selector;
    EnvironmentCapacityHint unknown;
};

TEST_F(FeasibilitySelectorTest, EmptyReportIsLocal)
{
    EXPECT_TRUE(selector.canGenerateLocally({}, unknown));
}

TEST_F(FeasibilitySelectorTest, PayloadAtCeilingIsLocal)
{
    auto assets = assetsOf(4, 10 * MIB);
    FeasibilityDecision decision = selector.decide(assets, unknown);
    EXPECT_TRUE(decision.local);
    EXPECT_EQ(decision.estimated_payload_bytes, 40 * MIB);
}

TEST_F(FeasibilitySelectorTest, PayloadOverCeilingIsDelegated)
{
    auto assets = assetsOf(4, 10 * MIB);
    assets.push_back(makeAsset("extra", 1));
    FeasibilityDecision decision = selector.decide(assets, unknown);
    EXPECT_FALSE(decision.local);
    EXPECT_FALSE(decision.reason.empty());
}

TEST_F(FeasibilitySelectorTest, LowMemoryLimitsImageCount)
{
    EnvironmentCapacityHint low;
    low.memory_gb = 2.0;

    EXPECT_TRUE(selector.canGenerateLocally(assetsOf(10, 1024), low));
    EXPECT_FALSE(selector.canGenerateLocally(assetsOf(11, 1024), low));
}

TEST_F(FeasibilitySelectorTest, AmpleOrUnknownMemoryAllowsManyImages)
{
    EnvironmentCapacityHint ample;
    ample.memory_gb = 16.0;

    EXPECT_TRUE(selector.canGenerateLocally(assetsOf(50, 1024), ample));
    EXPECT_TRUE(selector.canGenerateLocally(assetsOf(50, 1024), unknown));
}

TEST_F(FeasibilitySelectorTest, CustomCeilingIsHonoured)
{
    GenerationSettings settings;
    settings.local_payload_ceiling_bytes = 1 * MIB;
    FeasibilitySelector strict(settings);

    EXPECT_TRUE(strict.canGenerateLocally(assetsOf(1, MIB), unknown));
    EXPECT_FALSE(strict.canGenerateLocally(assetsOf(2, MIB), unknown));
}

TEST_F(FeasibilitySelectorTest, EstimateSumsDeclaredSizes)
{
    EXPECT_EQ(FeasibilitySelector::estimatePayloadBytes(assetsOf(3, 700)), 2100u);
    EXPECT_EQ(FeasibilitySelector::estimatePayloadBytes({}), 0u);
}

TEST_F(FeasibilitySelectorTest, DetectReportsPositiveMemoryWhenKnown)
{
    EnvironmentCapacityHint detected = EnvironmentCapacityHint::detect();
    if (detected.memory_gb)
    {
        EXPECT_GT(*detected.memory_gb, 0.0);
    }
}
