#include "text_parsing.hpp"

#include <algorithm>
#include <regex>

namespace text_parsing
{
    optional<double> parseAmount(const string &text)
    {
        static const regex amount_pattern(R"(^\$?(\d+(?:\.\d+)?)([kKmM]?)$)");

        string cleaned;
        for (char c : text)
        {
            if (c != ',' && c != ' ')
                cleaned += c;
        }

        smatch match;
        if (!regex_match(cleaned, match, amount_pattern))
            return nullopt;

        double value = stod(match[1].str());
        string suffix = match[2].str();
        if (suffix == "k" || suffix == "K")
            value *= 1000.0;
        else if (suffix == "m" || suffix == "M")
            value *= 1000000.0;

        return value;
    }

    optional<int> parseTimer(const string &text)
    {
        static const regex timer_pattern(R"(^(\d{1,2}):(\d{2})$)");

        smatch match;
        if (!regex_match(text, match, timer_pattern))
            return nullopt;

        int minutes = stoi(match[1].str());
        int seconds = stoi(match[2].str());
        if (seconds >= 60)
            return nullopt;

        return minutes * 60 + seconds;
    }

    bool isPlayerName(const string &text)
    {
        static const regex name_pattern(R"(^[A-Za-z0-9_]+$)");
        return regex_match(text, name_pattern);
    }

    optional<TextElement> bestMatch(const vector<TextElement> &elements, double min_confidence,
                                    const function<bool(const string &)> &accept)
    {
        optional<TextElement> best;
        for (const auto &element : elements)
        {
            if (element.confidence < min_confidence || !accept(element.text))
                continue;
            if (!best || element.confidence > best->confidence)
                best = element;
        }
        return best;
    }

    string joinText(vector<TextElement> elements)
    {
        sort(elements.begin(), elements.end(), [](const TextElement &a, const TextElement &b)
             { return a.bbox.x < b.bbox.x; });

        string text;
        for (const auto &element : elements)
        {
            if (!text.empty())
                text += " ";
            text += element.text;
        }
        return text;
    }

} // namespace text_parsing
