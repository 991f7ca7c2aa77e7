#include "enoch/attacks_tbl.hpp"

namespace enoch {

static inline bool on_board(int f, int r){ return f >= 0 && f < 8 && r >= 0 && r < 8; }

static AttackTables build() {
  AttackTables T{};

  static constexpr int DF[8] = { 0, +1, +1, +1,  0, -1, -1, -1 };
  static constexpr int DR[8] = {+1, +1,  0, -1, -1, -1,  0, +1 };

  // Knight jumps (file, rank offsets)
  static constexpr int KN_DF[8] = {+1, +2, +2, +1, -1, -2, -2, -1};
  static constexpr int KN_DR[8] = {+2, +1, -1, -2, -2, -1, +1, +2};

  for (int s = 0; s < 64; ++s) {
    const int f0 = file_of(s), r0 = rank_of(s);
    const auto i = static_cast<std::size_t>(s);

    for (int k = 0; k < 8; ++k) {
      if (on_board(f0 + KN_DF[k], r0 + KN_DR[k]))
        T.knight[i] |= bit(make_square(f0 + KN_DF[k], r0 + KN_DR[k]));
    }

    for (int dir = 0; dir < 8; ++dir) {
      // King: one step
      if (on_board(f0 + DF[dir], r0 + DR[dir]))
        T.king[i] |= bit(make_square(f0 + DF[dir], r0 + DR[dir]));

      // Queen: two-square leap, intermediate square ignored
      if (on_board(f0 + 2 * DF[dir], r0 + 2 * DR[dir]))
        T.queen_leap[i] |= bit(make_square(f0 + 2 * DF[dir], r0 + 2 * DR[dir]));

      // Ray to the edge
      U64 ray = 0ULL;
      int f = f0 + DF[dir], r = r0 + DR[dir];
      while (on_board(f, r)) {
        ray |= bit(make_square(f, r));
        f += DF[dir]; r += DR[dir];
      }
      T.rays[i][static_cast<std::size_t>(dir)] = ray;
    }
  }

  return T;
}

const AttackTables& ATT() {
  static const AttackTables T = build();
  return T;
}

} // namespace enoch
