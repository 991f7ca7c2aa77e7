#include <cassert>
#include <iostream>
#include <string>
#include "positions.hpp"

int main() {
  using namespace enoch_test;

  Game g = Game::from_starting_position(standard_position());
  assert(g.apply_move(Army::Blue, sq("e2"), sq("e3")));
  assert(g.apply_move(Army::Red, sq("d7"), sq("d6")));
  g.capture_king(Army::Yellow);

  const std::string text = write_snapshot(g.snapshot());
  assert(text.rfind("enoch-snapshot 1\nturn 2\norder blue red black yellow\ncontrollers 1 1 2 2\n", 0) == 0);
  assert(text.find("army blue controller 1 frozen 0 stalemated 0 thrones e1 d1 zone ff00000000000000 pieces") != std::string::npos);
  assert(text.find("army yellow controller 2 frozen 1 ") != std::string::npos);

  // Load, rebuild derived state, write again: identical text
  const Snapshot snap = read_snapshot(text);
  assert(snap == g.snapshot());
  Game loaded = Game::from_snapshot(snap);
  assert(write_snapshot(loaded.snapshot()) == text);

  assert(loaded.current_army() == Army::Black);
  assert(loaded.board().occupancy() == g.board().occupancy());
  assert(loaded.board().free_squares() == g.board().free_squares());
  for (Army a : ALL_ARMIES) {
    assert(loaded.board().army_occupancy(a) == g.board().army_occupancy(a));
    assert(loaded.state().king_square(a) == g.state().king_square(a));
    assert(loaded.army_is_frozen(a) == g.army_is_frozen(a));
  }
  assert(loaded.legal_moves(Army::Black).size() == g.legal_moves(Army::Black).size());

  // The loaded game keeps playing
  assert(loaded.apply_move(Army::Black, sq("b4"), sq("c4")));
  assert(loaded.current_army() == Army::Blue);   // Yellow is frozen

  // Malformed input
  auto rejects = [](const std::string& s) {
    try { (void)read_snapshot(s); } catch (const SnapshotError&) { return true; }
    return false;
  };
  assert(rejects(""));
  assert(rejects("enoch-snapshot 2\n"));
  assert(rejects(text.substr(0, text.size() / 2)));
  assert(rejects(text + "extra\n"));
  std::string bad_turn = text;
  bad_turn.replace(bad_turn.find("turn 2"), 6, "turn 9");
  assert(rejects(bad_turn));

  // Two pieces on one square never load
  Snapshot overlap = snap;
  overlap.pieces[idx(Army::Red)][idx(PieceKind::Rook)] |= bit(sq("e1"));
  bool threw = false;
  try { (void)Game::from_snapshot(overlap); } catch (const SnapshotError&) { threw = true; }
  assert(threw);

  // Nor does a throne off the board
  Snapshot far_throne = snap;
  far_throne.armies[idx(Army::Black)].thrones[1] = 64;
  threw = false;
  try { (void)Game::from_snapshot(far_throne); } catch (const SnapshotError&) { threw = true; }
  assert(threw);

  std::cout << "snapshot_smoke ok\n";
  return 0;
}
