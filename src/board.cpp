#include "enoch/board.hpp"
#include <cctype>


namespace enoch {


Board::Board() { clear(); }


void Board::clear() {
for (auto& by_army : bb_) for (auto& b : by_army) b = 0ULL;
armies_ = {};
zones_ = DEFAULT_PROMOTION_ZONES;
refresh_occupancy();
}


void Board::refresh_occupancy() {
by_team_ = {};
for (Army a : ALL_ARMIES) {
U64 occ = 0ULL;
for (U64 b : bb_[idx(a)]) occ |= b;
by_army_[idx(a)] = occ;
by_team_[idx(team_of(a))] |= occ;
}
all_ = by_team_[idx(Team::Air)] | by_team_[idx(Team::Earth)];
free_ = ~all_;
}


void Board::place_piece(Army a, PieceKind k, Square s) {
if (piece_at(s, nullptr, nullptr)) throw BoardError("place_piece: square already occupied");
bb_[idx(a)][idx(k)] |= bit(s);
refresh_occupancy();
}


void Board::remove_piece(Army a, PieceKind k, Square s) {
bb_[idx(a)][idx(k)] &= ~bit(s);
refresh_occupancy();
}


void Board::move_piece(Army a, PieceKind k, Square from, Square to) {
U64& b = bb_[idx(a)][idx(k)];
b &= ~bit(from);
b |= bit(to);
refresh_occupancy();
}


void Board::clear_square(Square s) {
for (auto& by_army : bb_) for (auto& b : by_army) b &= ~bit(s);
refresh_occupancy();
}


Square Board::demote_piece_to_pawn(Army a, PieceKind k) {
if (k == PieceKind::Pawn) return NO_SQUARE;
U64& b = bb_[idx(a)][idx(k)];
if (!b) return NO_SQUARE;
const Square s = __builtin_ctzll(b);
b &= ~bit(s);
bb_[idx(a)][idx(PieceKind::Pawn)] |= bit(s);
refresh_occupancy();
return s;
}


bool Board::piece_at(Square s, Army* army_out, PieceKind* kind_out) const {
for (Army a : ALL_ARMIES) {
for (PieceKind k : ALL_KINDS) {
if (bb_[idx(a)][idx(k)] & bit(s)) {
if (army_out) *army_out = a;
if (kind_out) *kind_out = k;
return true;
}
}
}
return false;
}


Square Board::king_square(Army a) const {
const U64 k = bb_[idx(a)][idx(PieceKind::King)];
return k ? __builtin_ctzll(k) : NO_SQUARE;
}


bool Board::throne_owner(Square s, Army* army_out) const {
for (Army a : ALL_ARMIES) {
const auto& t = armies_[idx(a)].thrones;
if (t[0] == s || t[1] == s) {
if (army_out) *army_out = a;
return true;
}
}
return false;
}


std::array<int, KIND_N> Board::piece_counts(Army a) const {
std::array<int, KIND_N> counts{};
for (PieceKind k : ALL_KINDS)
counts[idx(k)] = __builtin_popcountll(bb_[idx(a)][idx(k)]);
return counts;
}


static inline char piece_char(Army a, PieceKind k) {
const char* L = "KQBNRP"; // indexed by PieceKind
const char c = L[idx(k)];
// Blue and Red upper case, Black and Yellow lower case
return (a == Army::Blue || a == Army::Red) ? c : static_cast<char>(std::tolower(c));
}


std::vector<std::string> Board::ascii_rows() const {
std::vector<std::string> rows;
rows.reserve(8);
for (int r = 7; r >= 0; --r) {
std::string line;
line += static_cast<char>('1' + r);
for (int f = 0; f < 8; ++f) {
Army a; PieceKind k;
line += ' ';
line += piece_at(make_square(f, r), &a, &k) ? piece_char(a, k) : '.';
}
rows.push_back(line);
}
return rows;
}


} // namespace enoch
