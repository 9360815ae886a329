#include "detector/card_detection_stage.hpp"
#include "detector/card_labels.hpp"
#include "detector/heuristic/heuristic_card_detector.hpp"
#include "detector/yolo/yolo_card_detector.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace gtest
{

    struct StageFixture
    {
        fakes::FakeCardDetector *primary = nullptr;
        fakes::FakeCardDetector *fallback = nullptr;
        unique_ptr<CardDetectionStage> stage;

        StageFixture(DetectionStatus primary_status, vector<Card> primary_cards = {})
        {
            auto p = make_unique<fakes::FakeCardDetector>(DetectorKind::PRIMARY, primary_status, primary_cards);
            auto f = make_unique<fakes::FakeCardDetector>(DetectorKind::FALLBACK, DetectionStatus::DETECTED,
                                                          vector<Card>{fakes::makeCard("?", "?", 0.5f)});
            primary = p.get();
            fallback = f.get();
            stage = make_unique<CardDetectionStage>(move(p), move(f));
        }
    };

    static const Mat blank(200, 300, CV_8UC3, Scalar(0, 0, 0));
    static const Region board{0, 0, 300, 200};

    TEST(CardDetectionStage, PrimaryResultIsUsed)
    {
        StageFixture f(DetectionStatus::DETECTED, {fakes::makeCard("A", "s"), fakes::makeCard("K", "h")});
        DetectionResult result = f.stage->detect(blank, board);

        EXPECT_EQ(result.status, DetectionStatus::DETECTED);
        EXPECT_EQ(result.source, DetectorKind::PRIMARY);
        EXPECT_EQ(result.cards.size(), 2u);
        EXPECT_EQ(f.fallback->calls, 0);
    }

    //! Nothing on the table is an answer, not a failure
    TEST(CardDetectionStage, EmptyPrimaryResultIsFinal)
    {
        StageFixture f(DetectionStatus::NO_DETECTION);
        DetectionResult result = f.stage->detect(blank, board);

        EXPECT_EQ(result.status, DetectionStatus::NO_DETECTION);
        EXPECT_TRUE(result.cards.empty());
        EXPECT_EQ(f.fallback->calls, 0);
    }

    TEST(CardDetectionStage, FailedPrimarySwitchesToFallback)
    {
        StageFixture f(DetectionStatus::FAILED);
        DetectionResult result = f.stage->detect(blank, board);

        EXPECT_EQ(f.fallback->calls, 1);
        EXPECT_EQ(result.source, DetectorKind::FALLBACK);
        EXPECT_NE(result.primary_error.find("forward pass failed"), string::npos);
        ASSERT_EQ(result.cards.size(), 1u);
        EXPECT_TRUE(result.cards[0].from_fallback);
    }

    TEST(CardDetectionStage, UnavailablePrimaryIsSkipped)
    {
        StageFixture f(DetectionStatus::DETECTED);
        f.primary->available = false;

        EXPECT_FALSE(f.stage->hasPrimary());
        DetectionResult result = f.stage->detect(blank, board);

        EXPECT_EQ(f.primary->calls, 0);
        EXPECT_EQ(result.source, DetectorKind::FALLBACK);
    }

    TEST(CardDetectionStage, NoDetectorAtAll)
    {
        CardDetectionStage stage(nullptr, nullptr);
        DetectionResult result = stage.detect(blank, board);
        EXPECT_EQ(result.status, DetectionStatus::UNAVAILABLE);
    }

    TEST(CardLabels, Parse)
    {
        EXPECT_EQ(card_labels::parse("10h"), make_pair(string("10"), string("h")));
        EXPECT_EQ(card_labels::parse("Th"), make_pair(string("10"), string("h")));
        EXPECT_EQ(card_labels::parse("As"), make_pair(string("A"), string("s")));
        EXPECT_EQ(card_labels::parse("QD"), make_pair(string("Q"), string("d")));
        EXPECT_FALSE(card_labels::parse("1h").has_value());
        EXPECT_FALSE(card_labels::parse("Kx").has_value());
        EXPECT_FALSE(card_labels::parse("chip").has_value());
    }

    TEST(CardLabels, LoadSkipsBlankLines)
    {
        fakes::TempDir dir;
        {
            ofstream file(dir.file("cards.names"));
            file << "As\n\nKh \r\n10d\n";
        }
        vector<string> labels = card_labels::load(dir.file("cards.names"));
        EXPECT_EQ(labels, (vector<string>{"As", "Kh", "10d"}));
        EXPECT_THROW(card_labels::load(dir.file("missing.names")), runtime_error);
    }

    TEST(YoloProcessing, LetterboxKeepsAspect)
    {
        Mat image(100, 200, CV_8UC3, Scalar(255, 255, 255));
        yolo_processing::Letterbox box = yolo_processing::letterbox(image, 640, 114);

        EXPECT_EQ(box.image.size(), Size(640, 640));
        EXPECT_FLOAT_EQ(box.scale, 3.2f);
        EXPECT_EQ(box.pad_x, 0);
        EXPECT_EQ(box.pad_y, 160);
        EXPECT_EQ(box.image.at<Vec3b>(0, 0), Vec3b(114, 114, 114));
        EXPECT_EQ(box.image.at<Vec3b>(320, 320), Vec3b(255, 255, 255));
    }

    TEST(YoloProcessing, DecodeRowMajor)
    {
        // Two candidates, three classes, no objectness column
        Mat output = (Mat_<float>(2, 7) << 100, 50, 20, 40, 0.1f, 0.8f, 0.05f,
                      300, 300, 10, 10, 0.1f, 0.1f, 0.1f);

        auto detections = yolo_processing::decodeOutput(output, 3, 0.25f);

        ASSERT_EQ(detections.size(), 1u);
        EXPECT_EQ(detections[0].class_id, 1);
        EXPECT_FLOAT_EQ(detections[0].score, 0.8f);
        EXPECT_FLOAT_EQ(detections[0].box.x, 90.0f);
        EXPECT_FLOAT_EQ(detections[0].box.y, 30.0f);
    }

    TEST(YoloProcessing, DecodeObjectnessHead)
    {
        Mat output = (Mat_<float>(1, 8) << 100, 100, 20, 20, 0.5f, 0.9f, 0.1f, 0.1f);

        auto detections = yolo_processing::decodeOutput(output, 3, 0.25f);

        ASSERT_EQ(detections.size(), 1u);
        EXPECT_EQ(detections[0].class_id, 0);
        EXPECT_NEAR(detections[0].score, 0.45f, 1e-5);
    }

    TEST(YoloProcessing, DecodeChannelFirst)
    {
        int sizes[] = {1, 7, 10};
        Mat output(3, sizes, CV_32F, Scalar(0));
        float *data = reinterpret_cast<float *>(output.data);
        const int candidates = 10;
        const float values[] = {64, 64, 16, 32, 0.0f, 0.0f, 0.7f};
        for (int c = 0; c < 7; c++)
            data[c * candidates + 4] = values[c];

        auto detections = yolo_processing::decodeOutput(output, 3, 0.25f);

        ASSERT_EQ(detections.size(), 1u);
        EXPECT_EQ(detections[0].class_id, 2);
        EXPECT_FLOAT_EQ(detections[0].box.width, 16.0f);
        EXPECT_FLOAT_EQ(detections[0].box.height, 32.0f);
    }

    TEST(YoloCardDetector, MissingModelIsUnavailable)
    {
        YoloCardDetector detector("/nonexistent/cards.onnx", "/nonexistent/cards.names");
        EXPECT_FALSE(detector.initialize());
        EXPECT_FALSE(detector.isInitialized());

        DetectionResult result = detector.detect(blank, board);
        EXPECT_EQ(result.status, DetectionStatus::UNAVAILABLE);
    }

    TEST(HeuristicCardDetector, CountsCardShapes)
    {
        Mat frame(400, 400, CV_8UC3, Scalar(20, 80, 20));
        rectangle(frame, Rect(120, 120, 40, 60), Scalar(250, 250, 250), FILLED);
        rectangle(frame, Rect(200, 120, 40, 60), Scalar(250, 250, 250), FILLED);
        // Wide bright bar, wrong aspect for a card
        rectangle(frame, Rect(110, 250, 150, 20), Scalar(250, 250, 250), FILLED);

        HeuristicCardDetector detector;
        DetectionResult result = detector.detect(frame, Region{100, 100, 200, 200});

        EXPECT_EQ(result.status, DetectionStatus::DETECTED);
        ASSERT_EQ(result.cards.size(), 2u);
        EXPECT_EQ(result.cards[0].rank, "?");
        EXPECT_TRUE(result.cards[0].from_fallback);
        EXPECT_FLOAT_EQ(result.cards[0].position.x, 140.0f);
        EXPECT_FLOAT_EQ(result.cards[0].position.y, 150.0f);
        EXPECT_LT(result.cards[0].position.x, result.cards[1].position.x);
    }

    TEST(HeuristicCardDetector, RegionOutsideFrame)
    {
        HeuristicCardDetector detector;
        DetectionResult result = detector.detect(blank, Region{1000, 1000, 50, 50});
        EXPECT_EQ(result.status, DetectionStatus::NO_DETECTION);
    }

} // namespace gtest
