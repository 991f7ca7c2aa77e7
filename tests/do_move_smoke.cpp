#include <cassert>
#include "enoch/legal.hpp"
#include "enoch/move_do.hpp"
#include "enoch/movegen.hpp"
#include "positions.hpp"

int main() {
  using namespace enoch_test;

  const Board b0 = build_board(standard_position());
  GameState st0;
  st0.sync_with_board(b0);

  MoveList ml;
  generate_pseudo_legal(b0, Army::Blue, ml);
  assert(ml.size() > 0);

  // Simulating on copies leaves the source board alone
  const U64 occ0 = b0.occupancy();
  for (const auto& m : ml) {
    Board b = b0;
    GameState st = st0;
    do_move(b, st, m);
    assert(b.occupancy() != occ0);
  }
  assert(b0.occupancy() == occ0);

  assert(leaves_king_safe(b0, st0, Army::Blue, Move{sq("e2"), sq("e3"), PieceKind::Pawn, MoveFlag::Quiet}));

  // A knight pinned against its king on the e-file
  {
    StartingPosition p = empty_position();
    put(p, Army::Blue, PieceKind::King, {"e1"});
    put(p, Army::Blue, PieceKind::Knight, {"e2"});
    put(p, Army::Red, PieceKind::Rook, {"e8"});
    put(p, Army::Red, PieceKind::King, {"a8"});
    const Board b = build_board(p);
    GameState st;
    st.sync_with_board(b);

    assert(!leaves_king_safe(b, st, Army::Blue, Move{sq("e2"), sq("c3"), PieceKind::Knight, MoveFlag::Quiet}));
    assert(leaves_king_safe(b, st, Army::Blue, Move{sq("e1"), sq("d1"), PieceKind::King, MoveFlag::Quiet}));
  }

  // Capturing a king freezes the victim and empties its king cache
  {
    StartingPosition p = empty_position();
    put(p, Army::Blue, PieceKind::Rook, {"a1"});
    put(p, Army::Red, PieceKind::King, {"a7"});
    Board b = build_board(p);
    GameState st;
    st.sync_with_board(b);

    const MoveRecord rec = do_move(b, st, Move{sq("a1"), sq("a7"), PieceKind::Rook, MoveFlag::Capture | MoveFlag::KingCapture});
    assert(rec.captured && rec.victim == Army::Red && rec.victim_kind == PieceKind::King);
    assert(rec.mover == Army::Blue && rec.moved == PieceKind::Rook);
    assert(b.is_frozen(Army::Red) && st.frozen[idx(Army::Red)]);
    assert(st.king_square(Army::Red) == NO_SQUARE);
    assert(b.pieces(Army::Blue, PieceKind::Rook) == bit(sq("a7")));
    assert(b.army_occupancy(Army::Red) == 0ULL);
  }

  // The mover's king cache follows the king
  {
    Board b = b0;
    GameState st = st0;
    do_move(b, st, Move{sq("e1"), sq("e3"), PieceKind::King, MoveFlag::Quiet});
    assert(st.king_square(Army::Blue) == sq("e3"));
    assert(b.king_square(Army::Blue) == sq("e3"));
  }

  return 0;
}
