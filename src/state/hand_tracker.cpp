#include "hand_tracker.hpp"
#include "phase.hpp"
#include "utils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

using namespace std;

uint64_t HandTracker::fnv1a64(const string &text, uint64_t seed)
{
    uint64_t hash = seed;
    for (unsigned char c : text)
    {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool HandTracker::isPlaceholderName(const string &name)
{
    if (name.empty())
        return true;

    const string prefix = "Player_";
    if (name.rfind(prefix, 0) != 0 || name.size() == prefix.size())
        return false;

    for (size_t i = prefix.size(); i < name.size(); i++)
    {
        if (!isdigit(static_cast<unsigned char>(name[i])))
            return false;
    }
    return true;
}

static vector<string> boardCodes(const vector<Card> &cards)
{
    vector<string> codes;
    for (const auto &card : cards)
        codes.push_back(card.isKnown() ? card.code() : "??");
    return codes;
}

bool HandTracker::continuesHand(const vector<string> &board,
                                const map<int, string> &seats,
                                const map<int, string> &hole_cards) const
{
    if (hand_id_.empty())
        return false;

    // Board may only grow, and the cards already out stay put
    if (board.size() < board_.size())
        return false;

    for (size_t i = 0; i < board_.size(); i++)
    {
        if (board[i] != board_[i] && board[i] != "??" && board_[i] != "??")
            return false;
    }

    for (const auto &[position, name] : seats)
    {
        auto known = seats_.find(position);
        if (known != seats_.end() && known->second != name)
            return false;
    }

    for (const auto &[position, cards] : hole_cards)
    {
        auto known = hole_cards_.find(position);
        if (known != hole_cards_.end() && known->second != cards)
            return false;
    }

    return true;
}

HandTracker::Update HandTracker::update(const vector<Card> &community_cards, const vector<Player> &players)
{
    vector<string> board = boardCodes(community_cards);

    // Other board sizes are detector misses, never evidence of a new hand
    if (!game_phase::isValidBoardSize(board.size()))
    {
        if (!hand_id_.empty())
        {
            Update kept;
            kept.hand_id = hand_id_;
            kept.hand_number = hand_number_;
            return kept;
        }
        board.clear();
    }

    map<int, string> seats;
    map<int, string> hole_cards;
    for (const auto &player : players)
    {
        if (!isPlaceholderName(player.name))
            seats[player.position] = player.name;

        if (player.hole_cards.size() == 2 && player.hole_cards[0].isKnown() && player.hole_cards[1].isKnown())
            hole_cards[player.position] = player.hole_cards[0].code() + player.hole_cards[1].code();
    }

    Update result;

    if (continuesHand(board, seats, hole_cards))
    {
        // Fill in facts that became readable during the hand
        for (size_t i = 0; i < board.size(); i++)
        {
            if (i >= board_.size())
                board_.push_back(board[i]);
            else if (board_[i] == "??")
                board_[i] = board[i];
        }
        seats_.insert(seats.begin(), seats.end());
        hole_cards_.insert(hole_cards.begin(), hole_cards.end());

        result.hand_id = hand_id_;
        result.hand_number = hand_number_;
        return result;
    }

    // Canonical summary of the new hand's starting facts
    ostringstream summary;
    summary << hand_id_ << "|board:";
    for (const auto &code : board)
        summary << code << ",";
    summary << "|seats:";
    for (const auto &[position, name] : seats)
        summary << position << "=" << name << ",";
    summary << "|hole:";
    for (const auto &[position, cards] : hole_cards)
        summary << position << "=" << cards << ",";

    ostringstream id;
    id << "hand_" << hex << setw(16) << setfill('0') << fnv1a64(summary.str());

    string previous = hand_id_;
    hand_id_ = id.str();
    hand_number_++;
    board_ = board;
    seats_ = seats;
    hole_cards_ = hole_cards;

    log_debug("New hand " + log_string_src(hand_id_) + (previous.empty() ? "" : " (previous " + previous + ")"));

    result.hand_id = hand_id_;
    result.new_hand = true;
    result.hand_number = hand_number_;
    return result;
}

void HandTracker::reset()
{
    hand_id_.clear();
    hand_number_ = 0;
    board_.clear();
    seats_.clear();
    hole_cards_.clear();
}
