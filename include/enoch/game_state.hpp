#pragma once
#include <array>
#include "enoch/board.hpp"
#include "enoch/types.hpp"

namespace enoch {

// Fixed for the whole game
struct GameConfig {
  std::array<Army, ARMY_N> turn_order{Army::Blue, Army::Red, Army::Black, Army::Yellow};
  // Initial commander per army, indexed by Army
  std::array<Controller, ARMY_N> controllers{
    Controller::PlayerOne, Controller::PlayerOne, Controller::PlayerTwo, Controller::PlayerTwo
  };
};

// Transient per-army facts cached next to the Board. They are not kept in
// sync automatically: whoever edits the Board directly must call
// sync_with_board() before trusting them.
struct GameState {
  int turn_index = 0;                       // index into GameConfig::turn_order
  std::array<bool, ARMY_N> frozen{};
  std::array<Square, ARMY_N> king_sq{NO_SQUARE, NO_SQUARE, NO_SQUARE, NO_SQUARE};
  std::array<bool, ARMY_N> stalemated{};

  // Frozen flags and king squares from the board; stalemate flags cleared.
  void sync_with_board(const Board& b) {
    for (Army a : ALL_ARMIES) {
      frozen[idx(a)] = b.is_frozen(a);
      king_sq[idx(a)] = b.king_square(a);
      stalemated[idx(a)] = false;
    }
  }

  Square king_square(Army a) const { return king_sq[idx(a)]; }

  int kings_alive(Team t) const {
    int n = 0;
    for (Army a : team_armies(t))
      if (king_sq[idx(a)] != NO_SQUARE) ++n;
    return n;
  }
};

} // namespace enoch
