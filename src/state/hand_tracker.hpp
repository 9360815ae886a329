#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "game_models.hpp"

using namespace std;

// Assigns hand identifiers from what is visible on the table.
//
// A hand keeps its id while the board only grows (flop -> turn -> river) and
// every seat that shows a real name keeps showing the same one. The board
// shrinking or changing cards, a named seat changing occupant, or a player's
// known hole cards changing starts a new hand. A frame whose board size is not
// 0, 3, 4 or 5 keeps the current hand and leaves the tracked board alone. The id is a 64-bit FNV-1a hash
// chained from the previous id and the facts seen at the start of the hand,
// so it never depends on when a frame was taken.
class HandTracker
{
public:
    struct Update
    {
        string hand_id;
        bool new_hand = false;
        int hand_number = 0; // 1-based within this tracker
    };

    Update update(const vector<Card> &community_cards, const vector<Player> &players);

    const string &currentHandId() const { return hand_id_; }
    int handNumber() const { return hand_number_; }

    void reset();

    // "Player_3" style defaults and empty names are not identities
    static bool isPlaceholderName(const string &name);

    static uint64_t fnv1a64(const string &text, uint64_t seed = 14695981039346656037ULL);

private:
    bool continuesHand(const vector<string> &board,
                       const map<int, string> &seats,
                       const map<int, string> &hole_cards) const;

    string hand_id_;
    int hand_number_ = 0;
    vector<string> board_;         // Longest board seen in this hand
    map<int, string> seats_;       // position -> known name
    map<int, string> hole_cards_;  // position -> known hole cards
};
