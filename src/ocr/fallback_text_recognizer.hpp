#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "text_engine.hpp"

using namespace std;

// Text source used when the primary engine is skipped: the last good reading of
// each region, valid for a limited time, with reduced confidence and marked as fallback
class FallbackTextRecognizer
{
public:
    using Clock = chrono::steady_clock;

    explicit FallbackTextRecognizer(int ttl_ms = 3000, float confidence_decay = 0.9f);

    void remember(const string &region, const vector<TextElement> &elements, Clock::time_point now = Clock::now());

    // Empty when nothing usable is cached
    vector<TextElement> recall(const string &region, Clock::time_point now = Clock::now()) const;

    void clear() { readings_.clear(); }

private:
    struct Reading
    {
        vector<TextElement> elements;
        Clock::time_point seen;
    };

    chrono::milliseconds ttl_;
    float confidence_decay_;
    map<string, Reading> readings_;
};
