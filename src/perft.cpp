#include "enoch/perft.hpp"
#include <vector>

namespace enoch {

std::uint64_t perft(const Game& g, int depth) {
  if (depth == 0) return 1ULL;
  if (g.status() != GameStatus::Ongoing) return 0ULL;

  const Army us = g.current_army();
  const std::vector<Move> ml = g.legal_moves(us);
  if (depth == 1) return static_cast<std::uint64_t>(ml.size());

  std::uint64_t nodes = 0ULL;
  for (const auto& m : ml) {
    Game child = g;
    if (child.apply_move(us, m.from, m.to)) nodes += perft(child, depth - 1);
  }
  return nodes;
}

void perft_divide(const Game& g, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0 || g.status() != GameStatus::Ongoing) return;

  const Army us = g.current_army();
  for (const auto& m : g.legal_moves(us)) {
    Game child = g;
    if (child.apply_move(us, m.from, m.to)) out.emplace_back(m, perft(child, depth - 1));
  }
}

} // namespace enoch
