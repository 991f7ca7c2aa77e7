#pragma once
#include <array>
#include <stdexcept>
#include <string>
#include <vector>
#include "enoch/board.hpp"
#include "enoch/types.hpp"

namespace enoch {

struct PositionError : std::runtime_error { using std::runtime_error::runtime_error; };

// One army's pieces of one kind
struct Placement {
  Army army{Army::Blue};
  PieceKind kind{PieceKind::Pawn};
  U64 squares{0};
};

// A catalog entry describing how a game starts. The engine only checks it
// for structural consistency; what the layout means is up to the catalog.
struct StartingPosition {
  std::string name;
  std::array<Army, ARMY_N> turn_order{Army::Blue, Army::Red, Army::Black, Army::Yellow};
  // indexed by Army
  std::array<Controller, ARMY_N> controllers{
    Controller::PlayerOne, Controller::PlayerOne, Controller::PlayerTwo, Controller::PlayerTwo
  };
  std::array<std::array<Square, 2>, ARMY_N> thrones{{
    {{NO_SQUARE, NO_SQUARE}}, {{NO_SQUARE, NO_SQUARE}},
    {{NO_SQUARE, NO_SQUARE}}, {{NO_SQUARE, NO_SQUARE}}
  }};
  std::array<U64, ARMY_N> promotion_zones = DEFAULT_PROMOTION_ZONES;
  std::vector<Placement> placements;
};

// Each army exactly once
void validate_turn_order(const std::array<Army, ARMY_N>& order);

// No square claimed by two (army, kind) masks
void validate_disjoint(const Board& b);

// Every throne is NO_SQUARE or on the board
void validate_thrones(const Board& b);

// Throws PositionError on overlapping placements, off-board thrones or a
// turn order that is not a permutation.
Board build_board(const StartingPosition& start);

} // namespace enoch
