#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "enoch/game.hpp"
#include "enoch/move.hpp"

namespace enoch {

// Leaf count of the legal move tree, following the turn order the Game
// itself enforces (frozen and stalemated armies are skipped).
std::uint64_t perft(const Game& g, int depth);

// Per-move breakdown at root
void perft_divide(const Game& g, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out);

} // namespace enoch
