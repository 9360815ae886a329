#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "config/app_config.hpp"
#include "detector/card_detection_stage.hpp"
#include "errors/error_store.hpp"
#include "game_models.hpp"
#include "hand_tracker.hpp"
#include "ocr/text_recognizer.hpp"
#include "ui_processing.hpp"

using namespace cv;
using namespace std;

struct ParseResult
{
    optional<GameState> state; // Empty when a required extraction step failed
    VisionMetrics metrics;     // Always filled
    bool new_hand = false;
    int hand_number = 0;
};

// Turns one frame into a GameState.
// Community cards and the batched text pass are required; if either throws the
// frame yields no state. Each seat is rebuilt on its own and falls back to
// "Player_N", zero stack and zero bet when its readings are missing or weak.
class GameStateParser
{
public:
    GameStateParser(const AppConfig &config, CardDetectionStage &detector, TextRecognizer &text, ErrorStore &errors);

    ParseResult parse(const Mat &frame, double frame_rate = 0.0, int64_t frame_number = 0);

    const HandTracker &handTracker() const { return hand_tracker_; }

private:
    // Running totals for one frame's metrics
    struct Tally
    {
        double primary_card_confidence = 0.0;
        int primary_cards = 0;
        double primary_text_confidence = 0.0;
        int primary_texts = 0;
        int detected = 0;
        int failed = 0;
        int fallback = 0;
        vector<string> errors;

        void addCards(const DetectionResult &result);
        void addText(const TextElement &element);
    };

    vector<Card> detectCards(const Mat &frame, const string &area_name, const Region &area, Tally &tally, bool required);
    vector<pair<string, Region>> textRegions() const;
    Player buildPlayer(int position, const string &seat_name, const Mat &frame, const TextRecognition &text, Tally &tally);

    optional<TextElement> readField(const TextRecognition &text, const string &region, double threshold,
                                    const function<bool(const string &)> &accept, Tally &tally);

    AppConfig config_;
    vector<string> seat_names_;
    CardDetectionStage &detector_;
    TextRecognizer &text_;
    ErrorStore &errors_;
    HandTracker hand_tracker_;
};
