#include <cassert>
#include "positions.hpp"

int main() {
  using namespace enoch_test;

  // e-file pin: Blue Ke1, Ne2; Red rook e8.
  // Every knight jump would expose the king, so only Kd1 Kf1 Kd2 Kf2 remain.
  StartingPosition p = empty_position();
  put(p, Army::Blue, PieceKind::King, {"e1"});
  put(p, Army::Blue, PieceKind::Knight, {"e2"});
  put(p, Army::Red, PieceKind::Rook, {"e8"});
  put(p, Army::Red, PieceKind::King, {"a8"});
  put(p, Army::Black, PieceKind::King, {"h1"});
  put(p, Army::Yellow, PieceKind::King, {"h8"});
  Game g = Game::from_starting_position(p);

  assert(!g.king_in_check(Army::Blue));
  const auto ml = g.legal_moves(Army::Blue);
  assert(ml.size() == 4);
  assert(only_king_moves(ml));

  MoveResult r = g.apply_move(Army::Blue, sq("e2"), sq("c3"));
  assert(!r && r.error == MoveError::IllegalDestination);
  return 0;
}
