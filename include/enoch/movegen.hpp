#pragma once
#include "enoch/board.hpp"
#include "enoch/movelist.hpp"


namespace enoch {


// Pawns move and capture on different geometry, so they report two masks.
// attacks holds the forward diagonals not blocked by our own pieces; only the
// ones holding another army's piece are real captures.
struct PawnTargets {
U64 quiet = 0ULL;
U64 attacks = 0ULL;
};


// Destinations of the single piece on 'from' (pseudo-legal: our own king may
// be left attacked). Pieces of every other army count as capturable unless a
// kind rule forbids it.
U64 king_from(const Board& b, Army army, Square from);
U64 knight_from(const Board& b, Army army, Square from);
U64 rook_from(const Board& b, Army army, Square from);
U64 bishop_from(const Board& b, Army army, Square from);
U64 queen_from(const Board& b, Army army, Square from);
PawnTargets pawn_from(const Board& b, Army army, Square from);

// Union over every piece of that kind the army owns
U64 king_targets(const Board& b, Army army);
U64 knight_targets(const Board& b, Army army);
U64 rook_targets(const Board& b, Army army);
U64 bishop_targets(const Board& b, Army army);
U64 queen_targets(const Board& b, Army army);
PawnTargets pawn_targets(const Board& b, Army army);

// Single dispatch over the six kinds. For pawns: quiet moves plus the
// attack squares that hold a capturable piece.
U64 piece_targets(const Board& b, Army army, PieceKind kind, Square from);
U64 army_targets(const Board& b, Army army);

void generate_pseudo_legal(const Board& b, Army army, MoveList& out);


} // namespace enoch
