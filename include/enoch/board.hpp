#pragma once
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "enoch/types.hpp"


namespace enoch {


struct BoardError : std::runtime_error { using std::runtime_error::runtime_error; };


// Per-army metadata that lives next to the piece masks
struct ArmyState {
std::array<Square, 2> thrones{NO_SQUARE, NO_SQUARE}; // [0] is where a restored king returns
Controller controller = Controller::PlayerOne;
bool frozen = false;
};


class Board {
public:
Board();
void clear();


// Authoritative masks. set_pieces() is a raw write: derived occupancy is
// stale until refresh_occupancy() runs.
U64 pieces(Army a, PieceKind k) const { return bb_[idx(a)][idx(k)]; }
void set_pieces(Army a, PieceKind k, U64 mask) { bb_[idx(a)][idx(k)] = mask; }
void refresh_occupancy();


// Derived caches
U64 army_occupancy(Army a) const { return by_army_[idx(a)]; }
U64 team_occupancy(Team t) const { return by_team_[idx(t)]; }
U64 occupancy() const { return all_; }
U64 free_squares() const { return free_; }


// Single-square mutations; each leaves the derived masks current.
void place_piece(Army a, PieceKind k, Square s); // throws BoardError if s is taken
void remove_piece(Army a, PieceKind k, Square s);
void move_piece(Army a, PieceKind k, Square from, Square to);
void clear_square(Square s);
Square demote_piece_to_pawn(Army a, PieceKind k);


bool piece_at(Square s, Army* army_out, PieceKind* kind_out) const;
Square king_square(Army a) const;
bool throne_owner(Square s, Army* army_out) const;
std::array<int, KIND_N> piece_counts(Army a) const;


const ArmyState& army_state(Army a) const { return armies_[idx(a)]; }
void set_army_state(Army a, const ArmyState& st) { armies_[idx(a)] = st; }
bool is_frozen(Army a) const { return armies_[idx(a)].frozen; }
void set_frozen(Army a, bool frozen) { armies_[idx(a)].frozen = frozen; }
Controller controller(Army a) const { return armies_[idx(a)].controller; }
void set_controller(Army a, Controller c) { armies_[idx(a)].controller = c; }


U64 promotion_zone(Army a) const { return zones_[idx(a)]; }
void set_promotion_zone(Army a, U64 zone) { zones_[idx(a)] = zone; }


// "8 r . . k . . . ." style rows, rank 8 first
std::vector<std::string> ascii_rows() const;


private:
// bb_[army][kind]
std::array<std::array<U64, KIND_N>, ARMY_N> bb_{};
std::array<U64, ARMY_N> by_army_{};
std::array<U64, TEAM_N> by_team_{};
U64 all_ = 0ULL;
U64 free_ = ~0ULL;

std::array<ArmyState, ARMY_N> armies_{};
std::array<U64, ARMY_N> zones_ = DEFAULT_PROMOTION_ZONES;
};


} // namespace enoch
