#include "phase.hpp"
#include "utils.hpp"

namespace game_phase
{
    bool isValidBoardSize(size_t count)
    {
        return count == 0 || count == 3 || count == 4 || count == 5;
    }

    GamePhase fromCommunityCardCount(size_t count)
    {
        switch (count)
        {
        case 0:
            return GamePhase::PREFLOP;
        case 3:
            return GamePhase::FLOP;
        case 4:
            return GamePhase::TURN;
        case 5:
            return GamePhase::RIVER;
        default:
            log_warning("Unexpected community card count " + log_string(count) + ", assuming preflop");
            return GamePhase::PREFLOP;
        }
    }

} // namespace game_phase
