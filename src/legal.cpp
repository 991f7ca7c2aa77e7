#include "enoch/legal.hpp"
#include "enoch/attack.hpp"
#include "enoch/move_do.hpp"
#include "enoch/movegen.hpp"

namespace enoch {

bool leaves_king_safe(const Board& b, const GameState& st, Army army, const Move& m) {
  Board scratch = b;
  GameState scratch_st = st;
  do_move(scratch, scratch_st, m);
  return !king_in_check(scratch, scratch_st, army);
}

void generate_legal(const Board& b, const GameState& st, Army army, MoveList& out) {
  out.sz = 0;
  if (b.is_frozen(army) || st.frozen[idx(army)]) return;

  MoveList pseudo;
  generate_pseudo_legal(b, army, pseudo);

  MoveList king_moves;
  for (const auto& m : pseudo) {
    if (!leaves_king_safe(b, st, army, m)) continue;
    out.push(m);
    if (m.piece == PieceKind::King) king_moves.push(m);
  }

  // A king in check has to run if it can
  if (!king_moves.empty() && king_in_check(b, st, army)) out = king_moves;
}

bool must_move_king(const Board& b, const GameState& st, Army army) {
  if (!king_in_check(b, st, army)) return false;
  MoveList ml;
  generate_legal(b, st, army, ml);
  for (const auto& m : ml) {
    if (m.piece == PieceKind::King) return true;
  }
  return false;
}

} // namespace enoch
