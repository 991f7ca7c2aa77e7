#pragma once
#include "enoch/move.hpp"
#include "enoch/board.hpp"
#include "enoch/game_state.hpp"

namespace enoch {

// What do_move changed
struct MoveRecord {
  Army      mover{Army::Blue};
  PieceKind moved{PieceKind::Pawn};
  bool      captured{false};
  Army      victim{Army::Blue};
  PieceKind victim_kind{PieceKind::Pawn};
};

// Capture (a captured King freezes its army and empties its king cache),
// relocation, and king cache update for the mover. Promotion and throne
// seizure are left to the Game.
MoveRecord do_move(Board& b, GameState& st, const Move& m);

} // namespace enoch
