#include "ocr/text_recognizer.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

namespace gtest
{

    class TextRecognizerTest : public ::testing::Test
    {
    protected:
        OcrConfig config;
        fakes::FakeTextEngine *engine = nullptr;
        unique_ptr<TextRecognizer> recognizer;
        Mat frame = Mat(480, 640, CV_8UC3, Scalar(40, 40, 40));

        // Wide enough to skip upscaling, so the fake's word lands at the region center
        const Region pot{100, 100, 200, 60};

        void build()
        {
            auto owned = make_unique<fakes::FakeTextEngine>();
            engine = owned.get();
            region_batch::BatchParams params;
            params.denoise = false;
            recognizer = make_unique<TextRecognizer>(move(owned), config, params);
        }

        void SetUp() override
        {
            build();
        }

        TextRecognition run(const vector<pair<string, Region>> &regions)
        {
            return recognizer->recognize(frame, regions);
        }
    };

    TEST_F(TextRecognizerTest, PrimaryPassAttributesWordsToRegions)
    {
        ASSERT_TRUE(recognizer->initialize());

        TextRecognition result = run({{"pot_display", pot}});

        EXPECT_TRUE(result.primary_ran);
        EXPECT_EQ(engine->calls, 1);
        EXPECT_EQ(result.paths["pot_display"], TextPath::PRIMARY);
        ASSERT_EQ(result.regions["pot_display"].size(), 1u);

        const TextElement &element = result.regions["pot_display"][0];
        EXPECT_EQ(element.text, "1,250");
        EXPECT_FALSE(element.from_fallback);
        EXPECT_TRUE(pot.contains(element.center()));
    }

    TEST_F(TextRecognizerTest, SmallRegionAlwaysUsesFallback)
    {
        ASSERT_TRUE(recognizer->initialize());

        TextRecognition result = run({{"timer", Region{10, 10, 30, 15}}});

        EXPECT_EQ(result.paths["timer"], TextPath::REGION_TOO_SMALL);
        EXPECT_TRUE(result.usedFallback("timer"));
        EXPECT_FALSE(result.primary_ran);
        EXPECT_EQ(engine->calls, 0);
    }

    TEST_F(TextRecognizerTest, UnavailableEngineUsesFallback)
    {
        engine->available = false;
        EXPECT_FALSE(recognizer->initialize());
        EXPECT_FALSE(recognizer->isPrimaryAvailable());

        TextRecognition result = run({{"pot_display", pot}});

        EXPECT_EQ(result.paths["pot_display"], TextPath::ENGINE_UNAVAILABLE);
        EXPECT_TRUE(result.regions["pot_display"].empty());
        EXPECT_EQ(engine->calls, 0);
    }

    TEST_F(TextRecognizerTest, RateLimitRecallsLastReading)
    {
        config.min_interval_ms = 60000;
        build();
        ASSERT_TRUE(recognizer->initialize());

        run({{"pot_display", pot}});
        TextRecognition second = run({{"pot_display", pot}});

        EXPECT_EQ(engine->calls, 1);
        EXPECT_EQ(second.paths["pot_display"], TextPath::RATE_LIMITED);
        ASSERT_EQ(second.regions["pot_display"].size(), 1u);
        EXPECT_TRUE(second.regions["pot_display"][0].from_fallback);
        EXPECT_NEAR(second.regions["pot_display"][0].confidence, 0.81f, 1e-4);
    }

    TEST_F(TextRecognizerTest, EngineErrorIsReported)
    {
        ASSERT_TRUE(recognizer->initialize());
        engine->throw_on_recognize = true;

        TextRecognition result = run({{"pot_display", pot}});

        EXPECT_EQ(result.paths["pot_display"], TextPath::ENGINE_ERROR);
        EXPECT_EQ(result.error, "engine crashed");
        EXPECT_FALSE(result.primary_ran);
    }

    //! A slow pass is discarded and does not start the rate limit window
    TEST_F(TextRecognizerTest, SlowPassFallsBackAndRetriesNextCall)
    {
        config.max_duration_ms = 20;
        config.min_interval_ms = 60000;
        build();
        ASSERT_TRUE(recognizer->initialize());
        engine->delay_ms = 50;

        TextRecognition slow = run({{"pot_display", pot}});
        EXPECT_TRUE(slow.primary_ran);
        EXPECT_EQ(slow.paths["pot_display"], TextPath::TOO_SLOW);

        engine->delay_ms = 0;
        TextRecognition next = run({{"pot_display", pot}});
        EXPECT_EQ(engine->calls, 2);
        EXPECT_EQ(next.paths["pot_display"], TextPath::PRIMARY);
    }

    TEST(FallbackTextRecognizer, ReadingsExpire)
    {
        FallbackTextRecognizer fallback(1000, 0.9f);
        auto t0 = FallbackTextRecognizer::Clock::now();

        fallback.remember("pot_display", {TextElement{"40", 1.0f, Rect(0, 0, 10, 10)}}, t0);

        EXPECT_EQ(fallback.recall("pot_display", t0 + chrono::milliseconds(500)).size(), 1u);
        EXPECT_TRUE(fallback.recall("pot_display", t0 + chrono::milliseconds(1500)).empty());
        EXPECT_TRUE(fallback.recall("timer", t0).empty());
    }

} // namespace gtest
