#include <cassert>
#include <stdexcept>
#include <string>
#include "enoch/attacks_tbl.hpp"
#include "enoch/move.hpp"
#include "enoch/notation.hpp"
#include "enoch/types.hpp"


int main() {
using namespace enoch;

// Teams pair Blue with Black and Red with Yellow
assert(team_of(Army::Blue) == Team::Air && team_of(Army::Black) == Team::Air);
assert(team_of(Army::Red) == Team::Earth && team_of(Army::Yellow) == Team::Earth);
assert(ally_of(Army::Blue) == Army::Black && ally_of(Army::Yellow) == Army::Red);
assert(opponent(Team::Air) == Team::Earth);

// a1 and b2 share a diagonal system, b1 is on the other one
assert(diagonal_system(0) == DiagonalSystem::Cancer);
assert(diagonal_system(9) == DiagonalSystem::Cancer);
assert(diagonal_system(1) == DiagonalSystem::Aries);
assert((ARIES_DIAGONALS | CANCER_DIAGONALS) == ~0ULL && (ARIES_DIAGONALS & CANCER_DIAGONALS) == 0ULL);

const auto& T = ATT();
assert(__builtin_popcountll(T.king[0]) == 3);
assert(__builtin_popcountll(T.knight[0]) == 2);
assert(__builtin_popcountll(T.queen_leap[0]) == 3);    // c1 a3 c3
assert(__builtin_popcountll(T.queen_leap[27]) == 8);   // d4
assert(T.rays[0][DIR_N] == (FILE_A & ~1ULL));

assert(square_name(0) == "a1" && square_name(63) == "h8" && square_name(NO_SQUARE) == "-");
assert(parse_square("e4") == 28);
bool threw = false;
try { (void)parse_square("i9"); } catch (const std::invalid_argument&) { threw = true; }
assert(threw);

assert(army_token(Army::Yellow) == "yellow" && parse_army("black") == Army::Black);
assert(move_to_text(Move{12, 20, PieceKind::Pawn, MoveFlag::Quiet}) == "e2e3");
return 0;
}
