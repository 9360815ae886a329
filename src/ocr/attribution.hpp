#pragma once

#include <map>
#include <string>
#include <vector>
#include "config/region.hpp"
#include "text_engine.hpp"

namespace attribution
{
    // An element belongs to a region when its bbox center lies inside the region.
    // Partial overlap without the center inside does not count
    bool belongsTo(const TextElement &element, const Region &region);

    vector<TextElement> elementsIn(const vector<TextElement> &elements, const Region &region);

    // Every region gets an entry, possibly empty. Overlapping regions may share an element
    map<string, vector<TextElement>> attribute(const vector<TextElement> &elements,
                                               const vector<pair<string, Region>> &regions);

} // namespace attribution
