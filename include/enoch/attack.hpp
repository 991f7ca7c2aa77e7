#pragma once
#include "enoch/board.hpp"
#include "enoch/game_state.hpp"

namespace enoch {

// Can 'by' capture on s right now? A frozen army attacks nothing.
bool square_attacked_by_army(const Board& b, Square s, Army by);

// Either army of team 't'
bool square_attacked_by_team(const Board& b, Square s, Team t);

// Is the cached king square of 'army' attacked by the opposing team?
// An army without a king is never in check.
bool king_in_check(const Board& b, const GameState& st, Army army);

} // namespace enoch
