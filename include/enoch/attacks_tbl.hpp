#pragma once
#include <array>
#include <cstdint>
#include "enoch/types.hpp"

namespace enoch {

// Direction indices (clockwise from north)
enum : int { DIR_N=0, DIR_NE=1, DIR_E=2, DIR_SE=3, DIR_S=4, DIR_SW=5, DIR_W=6, DIR_NW=7 };

inline constexpr int ROOK_DIRS[4]   = { DIR_N, DIR_E, DIR_S, DIR_W };
inline constexpr int BISHOP_DIRS[4] = { DIR_NE, DIR_SE, DIR_SW, DIR_NW };

// Squares along N, NE, E and NW have growing indices, so the nearest piece
// on those rays is the lowest set bit; on the other four it is the highest.
inline constexpr bool dir_increasing(int dir) {
  return dir == DIR_N || dir == DIR_NE || dir == DIR_E || dir == DIR_NW;
}

struct AttackTables {
  // Step targets per origin square
  std::array<U64,64> king{};
  std::array<U64,64> knight{};

  // Queen leaps: exactly two squares along each of the eight directions
  std::array<U64,64> queen_leap{};

  // Rays: rays[s][dir] = every square from s (exclusive) to the edge
  std::array<std::array<U64,8>,64> rays{};
};

// Singleton accessor (built once, reused everywhere)
const AttackTables& ATT();

} // namespace enoch
