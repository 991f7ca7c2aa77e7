#include "enoch/move_do.hpp"

namespace enoch {

MoveRecord do_move(Board& b, GameState& st, const Move& m) {
  MoveRecord rec{};
  rec.moved = m.piece;
  b.piece_at(m.from, &rec.mover, &rec.moved);

  if (b.piece_at(m.to, &rec.victim, &rec.victim_kind)) {
    rec.captured = true;
    b.remove_piece(rec.victim, rec.victim_kind, m.to);
    if (rec.victim_kind == PieceKind::King) {
      b.set_frozen(rec.victim, true);
      st.frozen[idx(rec.victim)] = true;
      st.king_sq[idx(rec.victim)] = NO_SQUARE;
    }
  }

  b.move_piece(rec.mover, rec.moved, m.from, m.to);
  if (rec.moved == PieceKind::King) st.king_sq[idx(rec.mover)] = m.to;

  return rec;
}

} // namespace enoch
