#include <cassert>
#include "enoch/board.hpp"
#include "enoch/movegen.hpp"
#include "enoch/notation.hpp"

int main() {
  using namespace enoch;
  const Square d4 = parse_square("d4");

  // Case 1: open board rook on d4, 7 rank + 7 file
  {
    Board b;
    b.place_piece(Army::Blue, PieceKind::Rook, d4);
    assert(__builtin_popcountll(rook_from(b, Army::Blue, d4)) == 14);
  }

  // Case 2: knight on d6 is taken then the ray stops, own pawn f4 blocks.
  // up d5 d6(x), down d3 d2 d1, left c4 b4 a4, right e4 => 9
  {
    Board b;
    b.place_piece(Army::Blue, PieceKind::Rook, d4);
    b.place_piece(Army::Red, PieceKind::Knight, parse_square("d6"));
    b.place_piece(Army::Blue, PieceKind::Pawn, parse_square("f4"));
    const U64 t = rook_from(b, Army::Blue, d4);
    assert(__builtin_popcountll(t) == 9);
    assert(t & bit(parse_square("d6")));
    assert(!(t & bit(parse_square("d7"))));
    assert(!(t & bit(parse_square("f4"))));
  }

  // Case 3: decreasing rays find the nearest blocker too
  {
    Board b;
    b.place_piece(Army::Yellow, PieceKind::Rook, parse_square("h8"));
    b.place_piece(Army::Blue, PieceKind::Pawn, parse_square("h3"));
    b.place_piece(Army::Blue, PieceKind::Pawn, parse_square("h5"));
    b.place_piece(Army::Yellow, PieceKind::Pawn, parse_square("c8"));
    const U64 t = rook_targets(b, Army::Yellow);
    // down h7 h6 h5(x), left g8 f8 e8 d8
    assert(__builtin_popcountll(t) == 7);
    assert(!(t & bit(parse_square("h4"))));
    assert(!(t & bit(parse_square("c8"))));
  }

  return 0;
}
