#pragma once
#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include "enoch/board.hpp"
#include "enoch/game_state.hpp"

namespace enoch {

struct SnapshotError : std::runtime_error { using std::runtime_error::runtime_error; };

// Authoritative fields only. Occupancy aggregates and king squares are
// rebuilt on load (Game::refresh_derived).
struct Snapshot {
  std::array<std::array<U64, KIND_N>, ARMY_N> pieces{};
  std::array<ArmyState, ARMY_N> armies{};
  std::array<U64, ARMY_N> promotion_zones = DEFAULT_PROMOTION_ZONES;
  GameConfig config{};
  int turn_index = 0;
  std::array<bool, ARMY_N> stalemated{};
};

// Text layout, one record per line:
//   enoch-snapshot 1
//   turn <index>
//   order <army> <army> <army> <army>
//   controllers <1|2> x4                      (initial, Blue Black Red Yellow)
//   army <name> controller <1|2> frozen <0|1> stalemated <0|1>
//        thrones <sq|-> <sq|-> zone <hex> pieces <hex x6, King..Pawn>
std::string write_snapshot(const Snapshot& s);
Snapshot read_snapshot(std::string_view text);

bool operator==(const Snapshot& a, const Snapshot& b);

} // namespace enoch
