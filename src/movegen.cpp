#include "enoch/movegen.hpp"
#include "enoch/attacks_tbl.hpp"
#include <initializer_list>

namespace enoch {

static inline Square lsb(U64 b) { return __builtin_ctzll(b); }
static inline Square msb(U64 b) { return 63 - __builtin_clzll(b); }
static inline bool on_board(int f, int r) { return f >= 0 && f < 8 && r >= 0 && r < 8; }

// Squares on the ray strictly before the nearest occupied square.
// The nearest occupied square itself goes to *blocker (NO_SQUARE if none).
static inline U64 ray_until_blocker(Square s, int dir, U64 occupied, Square* blocker) {
  const auto& T = ATT();
  const U64 ray = T.rays[static_cast<std::size_t>(s)][static_cast<std::size_t>(dir)];
  const U64 hits = ray & occupied;
  if (!hits) { *blocker = NO_SQUARE; return ray; }
  const Square b = dir_increasing(dir) ? lsb(hits) : msb(hits);
  *blocker = b;
  return ray & ~(T.rays[static_cast<std::size_t>(b)][static_cast<std::size_t>(dir)] | bit(b));
}

// Forward step per army: Blue north, Red south, Black east, Yellow west
static inline void forward_of(Army a, int& df, int& dr) {
  switch (a) {
    case Army::Blue:   df =  0; dr = +1; return;
    case Army::Red:    df =  0; dr = -1; return;
    case Army::Black:  df = +1; dr =  0; return;
    case Army::Yellow: df = -1; dr =  0; return;
  }
}

U64 king_from(const Board& b, Army army, Square from) {
  return ATT().king[static_cast<std::size_t>(from)] & ~b.army_occupancy(army);
}

U64 knight_from(const Board& b, Army army, Square from) {
  return ATT().knight[static_cast<std::size_t>(from)] & ~b.army_occupancy(army);
}

U64 rook_from(const Board& b, Army army, Square from) {
  const U64 own = b.army_occupancy(army);
  U64 out = 0ULL;
  for (int dir : ROOK_DIRS) {
    Square blk;
    out |= ray_until_blocker(from, dir, b.occupancy(), &blk);
    if (blk != NO_SQUARE && !(own & bit(blk))) out |= bit(blk);
  }
  return out;
}

U64 bishop_from(const Board& b, Army army, Square from) {
  const U64 own = b.army_occupancy(army);
  const DiagonalSystem sys = diagonal_system(from);
  U64 out = 0ULL;
  for (int dir : BISHOP_DIRS) {
    Square blk;
    out |= ray_until_blocker(from, dir, b.occupancy(), &blk);
    if (blk == NO_SQUARE || (own & bit(blk))) continue;

    Army va = army; PieceKind vk = PieceKind::Pawn;
    b.piece_at(blk, &va, &vk);
    switch (vk) {
      case PieceKind::Bishop:
        break; // bishops never take bishops
      case PieceKind::Queen:
        if (diagonal_system(blk) == sys) out |= bit(blk);
        break;
      case PieceKind::King:
      case PieceKind::Knight:
      case PieceKind::Rook:
      case PieceKind::Pawn:
        out |= bit(blk);
        break;
    }
  }
  return out;
}

U64 queen_from(const Board& b, Army army, Square from) {
  const U64 leaps = ATT().queen_leap[static_cast<std::size_t>(from)] & ~b.army_occupancy(army);
  const DiagonalSystem sys = diagonal_system(from);

  U64 out = leaps & b.free_squares();
  U64 occupied = leaps & b.occupancy();
  while (occupied) {
    const Square t = lsb(occupied);
    occupied &= occupied - 1;

    Army va = army; PieceKind vk = PieceKind::Pawn;
    b.piece_at(t, &va, &vk);
    switch (vk) {
      case PieceKind::Queen:
        break; // queens never take queens
      case PieceKind::Bishop:
        if (diagonal_system(t) == sys) out |= bit(t);
        break;
      case PieceKind::King:
      case PieceKind::Knight:
      case PieceKind::Rook:
      case PieceKind::Pawn:
        out |= bit(t);
        break;
    }
  }
  return out;
}

PawnTargets pawn_from(const Board& b, Army army, Square from) {
  PawnTargets p;
  int df = 0, dr = 0;
  forward_of(army, df, dr);
  const int f0 = file_of(from), r0 = rank_of(from);

  if (on_board(f0 + df, r0 + dr)) {
    const Square t = make_square(f0 + df, r0 + dr);
    if (b.free_squares() & bit(t)) p.quiet |= bit(t);
  }

  // Diagonals: one step forward plus one step sideways
  const U64 own = b.army_occupancy(army);
  for (int side : {-1, +1}) {
    const int f = f0 + df + (df == 0 ? side : 0);
    const int r = r0 + dr + (dr == 0 ? side : 0);
    if (!on_board(f, r)) continue;
    const Square t = make_square(f, r);
    if (!(own & bit(t))) p.attacks |= bit(t);
  }
  return p;
}

template <typename Fn>
static inline U64 union_over(const Board& b, Army army, PieceKind kind, Fn fn) {
  U64 out = 0ULL;
  U64 pcs = b.pieces(army, kind);
  while (pcs) {
    out |= fn(b, army, lsb(pcs));
    pcs &= pcs - 1;
  }
  return out;
}

U64 king_targets(const Board& b, Army army)   { return union_over(b, army, PieceKind::King, king_from); }
U64 knight_targets(const Board& b, Army army) { return union_over(b, army, PieceKind::Knight, knight_from); }
U64 rook_targets(const Board& b, Army army)   { return union_over(b, army, PieceKind::Rook, rook_from); }
U64 bishop_targets(const Board& b, Army army) { return union_over(b, army, PieceKind::Bishop, bishop_from); }
U64 queen_targets(const Board& b, Army army)  { return union_over(b, army, PieceKind::Queen, queen_from); }

PawnTargets pawn_targets(const Board& b, Army army) {
  PawnTargets all;
  U64 pawns = b.pieces(army, PieceKind::Pawn);
  while (pawns) {
    const PawnTargets p = pawn_from(b, army, lsb(pawns));
    all.quiet |= p.quiet;
    all.attacks |= p.attacks;
    pawns &= pawns - 1;
  }
  return all;
}

U64 piece_targets(const Board& b, Army army, PieceKind kind, Square from) {
  switch (kind) {
    case PieceKind::King:   return king_from(b, army, from);
    case PieceKind::Queen:  return queen_from(b, army, from);
    case PieceKind::Bishop: return bishop_from(b, army, from);
    case PieceKind::Knight: return knight_from(b, army, from);
    case PieceKind::Rook:   return rook_from(b, army, from);
    case PieceKind::Pawn: {
      const PawnTargets p = pawn_from(b, army, from);
      return p.quiet | (p.attacks & b.occupancy());
    }
  }
  return 0ULL;
}

U64 army_targets(const Board& b, Army army) {
  const PawnTargets p = pawn_targets(b, army);
  return (p.quiet | (p.attacks & b.occupancy()))
       | king_targets(b, army)
       | knight_targets(b, army)
       | rook_targets(b, army)
       | bishop_targets(b, army)
       | queen_targets(b, army);
}

void generate_pseudo_legal(const Board& b, Army army, MoveList& out) {
  out.sz = 0;
  const U64 zone = b.promotion_zone(army);

  for (PieceKind k : ALL_KINDS) {
    U64 pcs = b.pieces(army, k);
    while (pcs) {
      const Square from = lsb(pcs);
      pcs &= pcs - 1;

      U64 targets = piece_targets(b, army, k, from);
      while (targets) {
        const Square to = lsb(targets);
        targets &= targets - 1;

        MoveFlag flags = MoveFlag::Quiet;
        Army va = army; PieceKind vk = PieceKind::Pawn;
        if (b.piece_at(to, &va, &vk)) {
          flags = MoveFlag::Capture;
          if (vk == PieceKind::King) flags = flags | MoveFlag::KingCapture;
        }
        if (k == PieceKind::Pawn && (zone & bit(to))) flags = flags | MoveFlag::Promotion;
        out.push(Move{ from, to, k, flags });
      }
    }
  }
}

} // namespace enoch
