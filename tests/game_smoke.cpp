#include <cassert>
#include <iostream>
#include <string>
#include "positions.hpp"

int main() {
  using namespace enoch_test;

  Game g = Game::from_starting_position(standard_position());

  // Every king on its throne: nobody has won, nothing is over
  Team winner = Team::Air;
  assert(!g.winning_team(&winner));
  assert(!g.draw_condition());
  assert(g.status() == GameStatus::Ongoing);
  assert(g.current_army() == Army::Blue);
  for (Army a : ALL_ARMIES) {
    const ArmyStatus s = g.army_status(a);
    assert(!s.frozen && !s.stalemated && !s.in_check);
    assert(g.state().king_square(a) == g.board().army_state(a).thrones[0]);
  }
  assert(g.legal_moves(Army::Blue).size() == 16);
  assert(g.legal_moves(Army::Red).size() == 17);

  const auto counts = g.piece_counts(Army::Red);
  assert(counts[idx(PieceKind::Pawn)] == 4 && counts[idx(PieceKind::King)] == 1);

  // Rejections, each with its own reason, none of them touching the position
  const std::string before = write_snapshot(g.snapshot());
  MoveResult r = g.apply_move(Army::Red, sq("d7"), sq("d6"));
  assert(!r && r.error == MoveError::WrongTurn);
  r = g.apply_move(Army::Blue, sq("e4"), sq("e5"));
  assert(!r && r.error == MoveError::NoPieceAtSource);
  r = g.apply_move(Army::Blue, sq("d7"), sq("d6"));
  assert(!r && r.error == MoveError::ForeignPiece);
  r = g.apply_move(Army::Blue, sq("e1"), sq("d1"));
  assert(!r && r.error == MoveError::SelfCapture);
  r = g.apply_move(Army::Blue, sq("e2"), sq("e4"));
  assert(!r && r.error == MoveError::IllegalDestination);
  r = g.apply_move(Army::Blue, sq("e2"), 64);
  assert(!r && r.error == MoveError::IllegalDestination);
  assert(!r.message.empty());
  assert(std::string(move_error_name(MoveError::SelfCapture)) == "SelfCapture");
  assert(write_snapshot(g.snapshot()) == before);

  // One round in turn order Blue, Red, Black, Yellow
  r = g.apply_move(Army::Blue, sq("e2"), sq("e3"));
  assert(r && r.error == MoveError::None);
  assert(r.message == "Blue moved Pawn e2 to e3");
  assert(g.current_army() == Army::Red);
  assert(g.apply_move(Army::Red, sq("d7"), sq("d6")));
  assert(g.current_army() == Army::Black);
  assert(g.apply_move(Army::Black, sq("b4"), sq("c4")));
  assert(g.current_army() == Army::Yellow);
  assert(g.apply_move(Army::Yellow, sq("g4"), sq("f4")));
  assert(g.current_army() == Army::Blue);
  assert(g.board().pieces(Army::Black, PieceKind::Pawn) & bit(sq("c4")));

  // Blue loses its king on its own turn: frozen, no moves, and the turn
  // passes straight to Red
  g.capture_king(Army::Blue);
  assert(g.current_army() == Army::Red);
  assert(g.army_is_frozen(Army::Blue));
  assert(g.board().is_frozen(Army::Blue));
  assert(g.legal_moves(Army::Blue).empty());
  assert(g.board().pieces(Army::Blue, PieceKind::King) == 0ULL);
  assert(g.state().king_square(Army::Blue) == NO_SQUARE);
  r = g.apply_move(Army::Blue, sq("d2"), sq("d3"));
  assert(!r && r.error == MoveError::ArmyFrozen);

  r = g.apply_move(Army::Red, sq("c7"), sq("c6"));
  assert(r && g.current_army() == Army::Black);
  assert(g.apply_move(Army::Black, sq("b5"), sq("c5")));
  assert(g.apply_move(Army::Yellow, sq("g5"), sq("f5")));
  assert(g.current_army() == Army::Red);   // Blue skipped
  assert(g.status() == GameStatus::Ongoing);

  // The frozen pieces stay on the board
  assert(__builtin_popcountll(g.board().army_occupancy(Army::Blue)) == 8);
  std::cout << "game_smoke ok\n";
  return 0;
}
