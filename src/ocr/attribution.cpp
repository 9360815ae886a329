#include "attribution.hpp"

namespace attribution
{
    bool belongsTo(const TextElement &element, const Region &region)
    {
        return region.contains(element.center());
    }

    vector<TextElement> elementsIn(const vector<TextElement> &elements, const Region &region)
    {
        vector<TextElement> inside;
        for (const auto &element : elements)
        {
            if (belongsTo(element, region))
                inside.push_back(element);
        }
        return inside;
    }

    map<string, vector<TextElement>> attribute(const vector<TextElement> &elements,
                                               const vector<pair<string, Region>> &regions)
    {
        map<string, vector<TextElement>> result;
        for (const auto &[name, region] : regions)
            result[name] = elementsIn(elements, region);
        return result;
    }

} // namespace attribution
