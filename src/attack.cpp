#include "enoch/attack.hpp"
#include "enoch/movegen.hpp"

namespace enoch {

bool square_attacked_by_army(const Board& b, Square s, Army by) {
  if (b.is_frozen(by)) return false;
  const U64 m = bit(s);

  // Pawns only threaten squares that hold a piece
  if (pawn_targets(b, by).attacks & b.occupancy() & m) return true;

  if (king_targets(b, by) & m) return true;
  if (knight_targets(b, by) & m) return true;
  if (bishop_targets(b, by) & m) return true;
  if (rook_targets(b, by) & m) return true;
  if (queen_targets(b, by) & m) return true;

  return false;
}

bool square_attacked_by_team(const Board& b, Square s, Team t) {
  for (Army a : team_armies(t)) {
    if (square_attacked_by_army(b, s, a)) return true;
  }
  return false;
}

bool king_in_check(const Board& b, const GameState& st, Army army) {
  const Square ks = st.king_square(army);
  if (ks == NO_SQUARE) return false;
  return square_attacked_by_team(b, ks, opponent(team_of(army)));
}

} // namespace enoch
