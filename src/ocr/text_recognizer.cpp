#include "text_recognizer.hpp"
#include "attribution.hpp"
#include "utils.hpp"

string toString(TextPath path)
{
    switch (path)
    {
    case TextPath::PRIMARY:
        return "primary";
    case TextPath::ENGINE_UNAVAILABLE:
        return "engine_unavailable";
    case TextPath::RATE_LIMITED:
        return "rate_limited";
    case TextPath::REGION_TOO_SMALL:
        return "region_too_small";
    case TextPath::TOO_SLOW:
        return "too_slow";
    case TextPath::ENGINE_ERROR:
        return "engine_error";
    }
    return "unknown";
}

TextRecognizer::TextRecognizer(unique_ptr<TextEngine> engine, const OcrConfig &config,
                               const region_batch::BatchParams &batch_params)
    : engine_(move(engine)), config_(config), batch_params_(batch_params), fallback_(config.fallback_ttl_ms)
{
}

bool TextRecognizer::initialize()
{
    if (!engine_)
    {
        log_warning("No text engine configured, text extraction runs on fallback only");
        return false;
    }

    if (!engine_->initialize())
    {
        log_warning("Text engine " + engine_->name() + " unavailable, text extraction runs on fallback only");
        return false;
    }

    log_info("Text engine " + log_string_src(engine_->name()) + " ready");
    return true;
}

bool TextRecognizer::tooSmall(const Region &region) const
{
    return region.width < config_.min_region_width || region.height < config_.min_region_height;
}

void TextRecognizer::useFallback(TextRecognition &result, const string &name, TextPath path,
                                 FallbackTextRecognizer::Clock::time_point now)
{
    result.regions[name] = fallback_.recall(name, now);
    result.paths[name] = path;
}

TextRecognition TextRecognizer::recognize(const Mat &frame, const vector<pair<string, Region>> &regions)
{
    TextRecognition result;
    auto now = chrono::steady_clock::now();

    optional<TextPath> global_skip;
    if (!isPrimaryAvailable())
        global_skip = TextPath::ENGINE_UNAVAILABLE;
    else if (last_pass_end_ && now - *last_pass_end_ < chrono::milliseconds(config_.min_interval_ms))
        global_skip = TextPath::RATE_LIMITED;

    vector<pair<string, Region>> batched;
    for (const auto &[name, region] : regions)
    {
        if (tooSmall(region))
            useFallback(result, name, TextPath::REGION_TOO_SMALL, now);
        else if (global_skip)
            useFallback(result, name, *global_skip, now);
        else
            batched.emplace_back(name, region);
    }

    if (batched.empty())
        return result;

    region_batch::Batch batch = region_batch::build(frame, batched, batch_params_);

    vector<TextElement> elements;
    auto start = chrono::steady_clock::now();
    try
    {
        if (!batch.empty())
            elements = batch.toFrameCoordinates(engine_->recognize(batch.mosaic));
    }
    catch (const exception &e)
    {
        result.error = e.what();
        log_warning("Text engine failed: " + result.error);
        for (const auto &entry : batched)
            useFallback(result, entry.first, TextPath::ENGINE_ERROR, now);
        return result;
    }
    auto end = chrono::steady_clock::now();

    result.primary_ran = true;
    result.duration_ms = time_utils::millisecondsBetween(start, end);

    if (result.duration_ms > config_.max_duration_ms)
    {
        log_warning("Text pass took " + log_string(static_cast<int>(result.duration_ms)) + " ms, using fallback readings");
        for (const auto &entry : batched)
            useFallback(result, entry.first, TextPath::TOO_SLOW, now);
        return result;
    }

    last_pass_end_ = end;

    map<string, vector<TextElement>> attributed = attribution::attribute(elements, batched);
    for (auto &[name, words] : attributed)
    {
        fallback_.remember(name, words, end);
        result.regions[name] = move(words);
        result.paths[name] = TextPath::PRIMARY;
    }

    return result;
}
