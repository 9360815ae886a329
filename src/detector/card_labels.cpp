#include "card_labels.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace card_labels
{
    optional<pair<string, string>> parse(const string &label)
    {
        if (label.size() < 2 || label.size() > 3)
            return nullopt;

        char suit = static_cast<char>(tolower(static_cast<unsigned char>(label.back())));
        if (suit != 'h' && suit != 'd' && suit != 'c' && suit != 's')
            return nullopt;

        string rank = label.substr(0, label.size() - 1);
        for (char &c : rank)
            c = static_cast<char>(toupper(static_cast<unsigned char>(c)));

        if (rank == "T")
            rank = "10";

        static const vector<string> ranks = {"2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A"};
        for (const auto &known : ranks)
        {
            if (rank == known)
                return make_pair(rank, string(1, suit));
        }
        return nullopt;
    }

    vector<string> load(const string &path)
    {
        ifstream file(path);
        if (!file)
            throw runtime_error("Cannot read labels file " + path);

        vector<string> labels;
        string line;
        while (getline(file, line))
        {
            while (!line.empty() && isspace(static_cast<unsigned char>(line.back())))
                line.pop_back();
            if (!line.empty())
                labels.push_back(line);
        }
        return labels;
    }

} // namespace card_labels
