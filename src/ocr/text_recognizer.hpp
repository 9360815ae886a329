#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config/app_config.hpp"
#include "fallback_text_recognizer.hpp"
#include "region_batch.hpp"
#include "text_engine.hpp"

// How a region's text was obtained
enum class TextPath
{
    PRIMARY,
    ENGINE_UNAVAILABLE,
    RATE_LIMITED,
    REGION_TOO_SMALL,
    TOO_SLOW,
    ENGINE_ERROR
};

string toString(TextPath path);

struct TextRecognition
{
    map<string, vector<TextElement>> regions; // Frame coordinates, one entry per requested region
    map<string, TextPath> paths;
    bool primary_ran = false;
    double duration_ms = 0.0; // Primary pass wall time
    string error;             // Engine exception text, if any

    bool usedFallback(const string &region) const
    {
        auto it = paths.find(region);
        return it != paths.end() && it->second != TextPath::PRIMARY;
    }
};

// Batched text extraction with primary/fallback gating.
//
// The primary engine is skipped for every region when it failed to initialize
// or the previous successful pass ended less than min_interval_ms ago, and for
// any region smaller than the minimum usable size. A pass slower than
// max_duration_ms is discarded in favour of the fallback and does not count
// for rate limiting.
class TextRecognizer
{
public:
    TextRecognizer(unique_ptr<TextEngine> engine, const OcrConfig &config,
                   const region_batch::BatchParams &batch_params = region_batch::BatchParams());

    bool initialize();
    bool isPrimaryAvailable() const { return engine_ && engine_->isInitialized(); }

    TextRecognition recognize(const Mat &frame, const vector<pair<string, Region>> &regions);

private:
    bool tooSmall(const Region &region) const;
    void useFallback(TextRecognition &result, const string &name, TextPath path, FallbackTextRecognizer::Clock::time_point now);

    unique_ptr<TextEngine> engine_;
    OcrConfig config_;
    region_batch::BatchParams batch_params_;
    FallbackTextRecognizer fallback_;
    optional<chrono::steady_clock::time_point> last_pass_end_;
};
