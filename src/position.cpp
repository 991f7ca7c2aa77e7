#include "enoch/position.hpp"

namespace enoch {

void validate_turn_order(const std::array<Army, ARMY_N>& order) {
  std::array<bool, ARMY_N> seen{};
  for (Army a : order) {
    const int i = static_cast<int>(a);
    if (i < 0 || i >= ARMY_N) throw PositionError("turn order names an unknown army");
    if (seen[idx(a)]) throw PositionError("turn order lists an army twice");
    seen[idx(a)] = true;
  }
}

void validate_disjoint(const Board& b) {
  U64 seen = 0ULL;
  for (Army a : ALL_ARMIES) {
    for (PieceKind k : ALL_KINDS) {
      const U64 m = b.pieces(a, k);
      if (seen & m) throw PositionError("two pieces share a square");
      seen |= m;
    }
  }
}

void validate_thrones(const Board& b) {
  for (Army a : ALL_ARMIES) {
    for (Square s : b.army_state(a).thrones) {
      if (s != NO_SQUARE && (s < 0 || s > 63)) throw PositionError("throne square off the board");
    }
  }
}

Board build_board(const StartingPosition& start) {
  validate_turn_order(start.turn_order);

  Board b;
  for (const auto& p : start.placements) {
    const U64 prev = b.pieces(p.army, p.kind);
    if (prev & p.squares) throw PositionError("placement repeats a square");
    b.set_pieces(p.army, p.kind, prev | p.squares);
  }
  validate_disjoint(b);
  b.refresh_occupancy();

  for (Army a : ALL_ARMIES) {
    ArmyState st;
    st.thrones = start.thrones[idx(a)];
    st.controller = start.controllers[idx(a)];
    st.frozen = false;
    b.set_army_state(a, st);
    b.set_promotion_zone(a, start.promotion_zones[idx(a)]);
  }
  validate_thrones(b);
  return b;
}

} // namespace enoch
