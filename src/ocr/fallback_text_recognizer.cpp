#include "fallback_text_recognizer.hpp"

FallbackTextRecognizer::FallbackTextRecognizer(int ttl_ms, float confidence_decay)
    : ttl_(ttl_ms), confidence_decay_(confidence_decay)
{
}

void FallbackTextRecognizer::remember(const string &region, const vector<TextElement> &elements, Clock::time_point now)
{
    if (elements.empty())
        return;

    readings_[region] = Reading{elements, now};
}

vector<TextElement> FallbackTextRecognizer::recall(const string &region, Clock::time_point now) const
{
    vector<TextElement> recalled;

    auto it = readings_.find(region);
    if (it == readings_.end() || now - it->second.seen > ttl_)
        return recalled;

    for (TextElement element : it->second.elements)
    {
        element.confidence *= confidence_decay_;
        element.from_fallback = true;
        recalled.push_back(element);
    }
    return recalled;
}
