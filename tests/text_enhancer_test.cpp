#include <gtest/gtest.h>
#include <string>
#include <nlohmann/json.hpp>
#include "core/text_enhancer.hpp"
#include "test_support.hpp"

using namespace test_support;
using json = nlohmann::json;

TEST(NeedsEnhancementTest, DetectsBulletsAndNumberedLists)
{
    EXPECT_TRUE(needsEnhancement("- cracked tiles"));
    EXPECT_TRUE(needsEnhancement("  * loose flashing"));
    EXPECT_TRUE(needsEnhancement("\xE2\x80\xA2 dented vents"));
    EXPECT_TRUE(needsEnhancement("Observed:\n1. hail spatter\n2. granule loss"));
    EXPECT_TRUE(needsEnhancement("  12. ridge cap"));
}

TEST(NeedsEnhancementTest, LeavesProseAlone)
{
    EXPECT_FALSE(needsEnhancement("The roof covering shows uniform wear."));
    EXPECT_FALSE(needsEnhancement("Well-maintained structure"));
    EXPECT_FALSE(needsEnhancement(""));
    EXPECT_FALSE(needsEnhancement("The roof slope is 4.5 degrees."));
    EXPECT_FALSE(needsEnhancement("Loss on 03.12.2024 at the site"));
}

class EnhanceModelTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        model.title = "Report";
        model.sections["buildingObservations"]["exteriorObservations"] = "- missing shingles";
        model.sections["buildingObservations"]["interiorObservations"] = "No interior damage was observed.";
        model.sections["conclusions"]["conclusions"] = "1. hail\n2. wind";
    }

    ReportContentModel model;
    FakeTextEnhancer enhancer;
};

TEST_F(EnhanceModelTest, RewritesOnlyListFieldsInSchemaOrder)
{
    ReportContentModel result = enhanceModel(model, enhancer, CancellationToken());

    ASSERT_EQ(enhancer.field_types.size(), 2u);
    EXPECT_EQ(enhancer.field_types[0], "exterior observations");
    EXPECT_EQ(enhancer.field_types[1], "conclusions");
    EXPECT_EQ(*result.findField("buildingObservations", "exteriorObservations"), "Prose: - missing shingles");
    EXPECT_EQ(*result.findField("buildingObservations", "interiorObservations"), "No interior damage was observed.");
    EXPECT_EQ(*model.findField("conclusions", "conclusions"), "1. hail\n2. wind");
}

TEST_F(EnhanceModelTest, FailureKeepsOriginalText)
{
    enhancer.succeed = false;
    ReportContentModel result = enhanceModel(model, enhancer, CancellationToken());

    EXPECT_EQ(enhancer.field_types.size(), 2u);
    EXPECT_EQ(*result.findField("buildingObservations", "exteriorObservations"), "- missing shingles");
    EXPECT_EQ(*result.findField("conclusions", "conclusions"), "1. hail\n2. wind");
}

TEST_F(EnhanceModelTest, CancelledBeforeStartMakesNoRequests)
{
    CancellationToken cancel;
    cancel.cancel();
    ReportContentModel result = enhanceModel(model, enhancer, cancel);

    EXPECT_TRUE(enhancer.field_types.empty());
    EXPECT_EQ(*result.findField("buildingObservations", "exteriorObservations"), "- missing shingles");
}

class HttpTextEnhancerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        http.server.Post("/api/ai/generate-text", [this](const httplib::Request &req, httplib::Response &res)
                         {
            last_body = json::parse(req.body);
            if (last_body["fieldType"] == "broken")
            {
                res.status = 500;
                return;
            }
            if (last_body["fieldType"] == "empty")
            {
                res.set_content(json{{"generatedText", ""}}.dump(), "application/json");
                return;
            }
            res.set_content(json{{"generatedText", "Rewritten paragraph."}}.dump(), "application/json"); });
        http.start();
        settings.base_url = http.url();
    }

    TextEnhancementSettings settings;
    json last_body;
    LocalHttpServer http; // Last member: stopped before the state its handlers touch
};

TEST_F(HttpTextEnhancerTest, PostsBulletsAndReturnsGeneratedText)
{
    HttpTextEnhancer enhancer(settings);
    auto text = enhancer.enhance("- one\n- two", "site observations");

    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "Rewritten paragraph.");
    EXPECT_EQ(last_body["bulletPoints"], "- one\n- two");
    EXPECT_EQ(last_body["fieldType"], "site observations");
    EXPECT_EQ(last_body["context"], "Civil engineering property inspection report");
}

TEST_F(HttpTextEnhancerTest, ServerErrorYieldsNothing)
{
    HttpTextEnhancer enhancer(settings);
    EXPECT_FALSE(enhancer.enhance("- one", "broken").has_value());
}

TEST_F(HttpTextEnhancerTest, EmptyReplyYieldsNothing)
{
    HttpTextEnhancer enhancer(settings);
    EXPECT_FALSE(enhancer.enhance("- one", "empty").has_value());
}

TEST_F(HttpTextEnhancerTest, UnconfiguredEndpointYieldsNothing)
{
    HttpTextEnhancer enhancer(TextEnhancementSettings{});
    EXPECT_FALSE(enhancer.enhance("- one", "conclusions").has_value());
}
