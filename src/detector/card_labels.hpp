#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace std;

namespace card_labels
{
    // "10h", "Th", "As", "QD" -> {"10","h"}, {"10","h"}, {"A","s"}, {"Q","d"}
    optional<pair<string, string>> parse(const string &label);

    // One class name per line, blank lines skipped. Throws runtime_error if unreadable
    vector<string> load(const string &path);

} // namespace card_labels
