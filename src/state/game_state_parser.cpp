#include "game_state_parser.hpp"
#include "phase.hpp"
#include "seat_layout.hpp"
#include "ocr/text_parsing.hpp"
#include "utils.hpp"

#include <stdexcept>

using namespace cv;
using namespace std;

void GameStateParser::Tally::addCards(const DetectionResult &result)
{
    for (const auto &card : result.cards)
    {
        detected++;
        if (card.from_fallback)
        {
            fallback++;
        }
        else
        {
            primary_card_confidence += card.confidence;
            primary_cards++;
        }
    }
}

void GameStateParser::Tally::addText(const TextElement &element)
{
    detected++;
    if (element.from_fallback)
    {
        fallback++;
    }
    else
    {
        primary_text_confidence += element.confidence;
        primary_texts++;
    }
}

GameStateParser::GameStateParser(const AppConfig &config, CardDetectionStage &detector, TextRecognizer &text, ErrorStore &errors)
    : config_(config), seat_names_(config.playerRegionNames()), detector_(detector), text_(text), errors_(errors)
{
}

vector<Card> GameStateParser::detectCards(const Mat &frame, const string &area_name, const Region &area, Tally &tally, bool required)
{
    DetectionResult result = detector_.detect(frame, area);

    if (!result.primary_error.empty())
    {
        errors_.logVisionError("CardDetectionStage", "detect", "Primary card detector failed, fallback used",
                               nullptr, ErrorSeverity::LOW, {{"region", area_name}, {"reason", result.primary_error}});
        tally.errors.push_back(area_name + ": primary " + result.primary_error);
    }

    if (result.status == DetectionStatus::FAILED || result.status == DetectionStatus::UNAVAILABLE)
    {
        string reason = area_name + ": " + toString(result.status) + (result.error.empty() ? "" : " " + result.error);
        if (required)
            throw runtime_error("Card detection " + reason);

        tally.failed++;
        tally.errors.push_back(reason);
        return {};
    }

    tally.addCards(result);
    return result.cards;
}

vector<pair<string, Region>> GameStateParser::textRegions() const
{
    vector<pair<string, Region>> regions;

    for (const char *name : {"pot_display", "timer", "betting_area"})
    {
        auto it = config_.regions.find(name);
        if (it != config_.regions.end())
            regions.emplace_back(it->first, it->second);
    }

    for (const auto &seat : seat_names_)
    {
        const Region &area = config_.regions.at(seat);
        regions.emplace_back(seat + ".name", seat_layout::nameArea(area));
        regions.emplace_back(seat + ".stack", seat_layout::stackArea(area));
        regions.emplace_back(seat + ".bet", seat_layout::betArea(area));
    }

    return regions;
}

optional<TextElement> GameStateParser::readField(const TextRecognition &text, const string &region, double threshold,
                                                 const function<bool(const string &)> &accept, Tally &tally)
{
    auto it = text.regions.find(region);
    if (it == text.regions.end())
    {
        tally.failed++;
        return nullopt;
    }

    optional<TextElement> best = text_parsing::bestMatch(it->second, threshold, accept);
    if (best)
        tally.addText(*best);
    else
        tally.failed++;

    return best;
}

Player GameStateParser::buildPlayer(int position, const string &seat_name, const Mat &frame, const TextRecognition &text, Tally &tally)
{
    static const auto is_amount = [](const string &s)
    { return text_parsing::parseAmount(s).has_value(); };

    Player player;
    player.position = position;
    player.name = "Player_" + to_string(position);

    const Region &seat = config_.regions.at(seat_name);
    const ThresholdConfig &thresholds = config_.thresholds;

    if (auto name = readField(text, seat_name + ".name", thresholds.player_name, text_parsing::isPlayerName, tally))
        player.name = name->text;

    if (auto stack = readField(text, seat_name + ".stack", thresholds.stack_size, is_amount, tally))
        player.stack_size = *text_parsing::parseAmount(stack->text);

    // No bet in front of a seat is the normal case, not a failed reading
    auto bet_words = text.regions.find(seat_name + ".bet");
    if (bet_words != text.regions.end())
    {
        if (auto bet = text_parsing::bestMatch(bet_words->second, thresholds.stack_size, is_amount))
        {
            player.current_bet = *text_parsing::parseAmount(bet->text);
            tally.addText(*bet);
        }
    }

    player.hole_cards = detectCards(frame, seat_name + ".cards", seat_layout::cardsArea(seat), tally, false);

    try
    {
        Region clipped = seat.clippedTo(frame.size());
        if (!clipped.empty())
        {
            ui_processing::PlayerStatus status = ui_processing::detectPlayerStatus(frame(clipped.toRect()));
            player.is_active = status.is_active;
            player.is_current = status.is_current;
        }
    }
    catch (const cv::Exception &e)
    {
        errors_.logVisionError("GameStateParser", "buildPlayer", "Seat status unreadable", &e, ErrorSeverity::LOW,
                               {{"seat", seat_name}});
        tally.errors.push_back(seat_name + ": status " + e.what());
    }

    return player;
}

ParseResult GameStateParser::parse(const Mat &frame, double frame_rate, int64_t frame_number)
{
    // Start a timer to measure processing time
    auto start_time = chrono::steady_clock::now();

    ParseResult result;
    Tally tally;
    result.metrics.timestamp = time_utils::Clock::now();
    result.metrics.frame_rate = frame_rate;

    try
    {
        if (frame.empty())
            throw invalid_argument("empty frame");

        GameState state;
        state.timestamp = result.metrics.timestamp;

        state.community_cards = detectCards(frame, "community_cards", config_.regions.at("community_cards"), tally, true);

        TextRecognition text = text_.recognize(frame, textRegions());
        if (!text.error.empty())
        {
            errors_.logVisionError("TextRecognizer", "recognize", "Text engine failed, fallback used", nullptr,
                                   ErrorSeverity::MEDIUM, {{"reason", text.error}});
            tally.errors.push_back("text: " + text.error);
        }

        const ThresholdConfig &thresholds = config_.thresholds;

        if (auto pot = readField(text, "pot_display", thresholds.pot_size, [](const string &s)
                                 { return text_parsing::parseAmount(s).has_value(); },
                                 tally))
            state.pot_size = *text_parsing::parseAmount(pot->text);

        if (auto timer = readField(text, "timer", thresholds.timer, [](const string &s)
                                   { return text_parsing::parseTimer(s).has_value(); },
                                   tally))
            state.timer_remaining = text_parsing::parseTimer(timer->text);

        for (const auto &seat : seat_names_)
        {
            int position = stoi(seat.substr(seat.find('_') + 1));
            state.players.push_back(buildPlayer(position, seat, frame, text, tally));
        }

        auto buttons = config_.regions.find("action_buttons");
        if (buttons != config_.regions.end())
        {
            Region clipped = buttons->second.clippedTo(frame.size());
            if (!clipped.empty())
                state.available_actions = ui_processing::detectActionButtons(frame(clipped.toRect()));
        }

        auto betting = text.regions.find("betting_area");
        if (betting != text.regions.end())
        {
            vector<string> words;
            for (const auto &element : betting->second)
                words.push_back(element.text);
            state.betting_options = ui_processing::parseBettingOptions(words);
        }

        state.phase = game_phase::fromCommunityCardCount(state.community_cards.size());

        HandTracker::Update hand = hand_tracker_.update(state.community_cards, state.players);
        state.hand_id = hand.hand_id;
        result.new_hand = hand.new_hand;
        result.hand_number = hand.hand_number;

        result.state = state;
    }
    catch (const exception &e)
    {
        errors_.logError(ErrorSeverity::MEDIUM, ErrorCategory::VISION, "GameStateParser", "parse",
                         string("Frame could not be parsed: ") + e.what(), &e, nlohmann::json::object(), frame_number);
        tally.errors.push_back(e.what());
        result.state.reset();
    }

    VisionMetrics &metrics = result.metrics;
    metrics.processing_time_ms = time_utils::millisecondsBetween(start_time, chrono::steady_clock::now());
    metrics.detection_confidence = tally.primary_cards ? tally.primary_card_confidence / tally.primary_cards : 0.0;
    metrics.text_confidence = tally.primary_texts ? tally.primary_text_confidence / tally.primary_texts : 0.0;
    metrics.elements_detected = tally.detected;
    metrics.elements_failed = tally.failed;
    metrics.fallback_elements = tally.fallback;
    metrics.error_details = tally.errors;

    return result;
}
