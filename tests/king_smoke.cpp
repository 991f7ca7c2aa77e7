#include <cassert>
#include "enoch/board.hpp"
#include "enoch/movegen.hpp"
#include "enoch/notation.hpp"

int main() {
  using namespace enoch;

  // King steps
  {
    Board b;
    b.place_piece(Army::Red, PieceKind::King, parse_square("e4"));
    assert(__builtin_popcountll(king_targets(b, Army::Red)) == 8);

    b.place_piece(Army::Red, PieceKind::Pawn, parse_square("e5"));
    b.place_piece(Army::Blue, PieceKind::Pawn, parse_square("d5"));
    const U64 t = king_from(b, Army::Red, parse_square("e4"));
    assert(__builtin_popcountll(t) == 7);
    assert(t & bit(parse_square("d5")));
  }
  {
    Board b;
    b.place_piece(Army::Blue, PieceKind::King, parse_square("a1"));
    assert(__builtin_popcountll(king_targets(b, Army::Blue)) == 3);
  }

  // Knight jumps
  {
    Board b;
    b.place_piece(Army::Black, PieceKind::Knight, parse_square("d4"));
    b.place_piece(Army::Black, PieceKind::Knight, parse_square("a1"));
    assert(__builtin_popcountll(knight_from(b, Army::Black, parse_square("d4"))) == 8);
    assert(__builtin_popcountll(knight_from(b, Army::Black, parse_square("a1"))) == 2);

    b.place_piece(Army::Black, PieceKind::Pawn, parse_square("b3"));
    assert(__builtin_popcountll(knight_from(b, Army::Black, parse_square("a1"))) == 1);
    assert(__builtin_popcountll(knight_from(b, Army::Black, parse_square("d4"))) == 7);
  }

  return 0;
}
