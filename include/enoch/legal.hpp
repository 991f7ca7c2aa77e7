#pragma once
#include "enoch/board.hpp"
#include "enoch/game_state.hpp"
#include "enoch/movelist.hpp"

namespace enoch {

// Plays m on a scratch copy of the position and reports whether the
// mover's king is still unattacked afterwards.
bool leaves_king_safe(const Board& b, const GameState& st, Army army, const Move& m);

// Legal moves for 'army'. Frozen armies get none. While the king is in
// check and can step somewhere safe, only King moves are returned.
void generate_legal(const Board& b, const GameState& st, Army army, MoveList& out);

// In check with at least one legal King move
bool must_move_king(const Board& b, const GameState& st, Army army);

} // namespace enoch
