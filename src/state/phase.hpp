#pragma once

#include <cstddef>
#include "game_models.hpp"

namespace game_phase
{
    // 0 -> PREFLOP, 3 -> FLOP, 4 -> TURN, 5 -> RIVER.
    // Any other count logs a warning and maps to PREFLOP
    GamePhase fromCommunityCardCount(size_t count);

    bool isValidBoardSize(size_t count);

} // namespace game_phase
