#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "text_engine.hpp"

namespace text_parsing
{
    // "1,250", "$40", "2.5K" -> value. Thousands separators and a leading '$' are ignored
    optional<double> parseAmount(const string &text);

    // "M:SS" or "MM:SS" -> seconds
    optional<int> parseTimer(const string &text);

    // Letters, digits and underscores only
    bool isPlayerName(const string &text);

    // Highest-confidence element at or above min_confidence whose text is accepted
    optional<TextElement> bestMatch(const vector<TextElement> &elements, double min_confidence,
                                    const function<bool(const string &)> &accept);

    // Words left to right, space separated
    string joinText(vector<TextElement> elements);

} // namespace text_parsing
