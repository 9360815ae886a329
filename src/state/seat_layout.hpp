#pragma once

#include "config/region.hpp"

// Fixed sub-areas of a seat rectangle
namespace seat_layout
{
    // Top-left third: player name
    inline Region nameArea(const Region &seat)
    {
        return Region{seat.x, seat.y, seat.width / 2, seat.height / 3};
    }

    // Lower-left third: chip stack
    inline Region stackArea(const Region &seat)
    {
        return Region{seat.x, seat.y + seat.height / 2, seat.width / 2, seat.height / 3};
    }

    // Top-right quarter: hole cards
    inline Region cardsArea(const Region &seat)
    {
        return Region{seat.x + seat.width / 2, seat.y, seat.width / 2, seat.height / 2};
    }

    // Chips pushed in front of the seat, may stick out to the left
    inline Region betArea(const Region &seat)
    {
        return Region{seat.x - 50, seat.y + seat.height / 2, 100, 50};
    }

} // namespace seat_layout
