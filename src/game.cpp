#include "enoch/game.hpp"

#include "enoch/attack.hpp"
#include "enoch/attacks_tbl.hpp"
#include "enoch/legal.hpp"
#include "enoch/move_do.hpp"
#include "enoch/movelist.hpp"
#include "enoch/notation.hpp"

#include <utility>

namespace enoch {
namespace {

static inline bool on_board(Square s) { return s >= 0 && s < 64; }

static MoveResult reject(MoveError e, std::string why) {
  MoveResult r;
  r.ok = false;
  r.error = e;
  r.message = std::move(why);
  return r;
}

} // namespace

const char* move_error_name(MoveError e) {
  switch (e) {
    case MoveError::None:                   return "None";
    case MoveError::GameOver:               return "GameOver";
    case MoveError::ArmyFrozen:             return "ArmyFrozen";
    case MoveError::WrongTurn:              return "WrongTurn";
    case MoveError::NoPieceAtSource:        return "NoPieceAtSource";
    case MoveError::ForeignPiece:           return "ForeignPiece";
    case MoveError::SelfCapture:            return "SelfCapture";
    case MoveError::IllegalDestination:     return "IllegalDestination";
    case MoveError::InvalidPromotionTarget: return "InvalidPromotionTarget";
  }
  return "?";
}

// ------------ construction ------------

Game::Game(const Board& board, const GameConfig& config)
  : board_(board), config_(config) {
  validate_turn_order(config_.turn_order);
  (void)ATT(); // warm the tables
  board_.refresh_occupancy();
  validate_disjoint(board_);
  state_.sync_with_board(board_);
}

Game Game::from_starting_position(const StartingPosition& start) {
  GameConfig cfg;
  cfg.turn_order = start.turn_order;
  cfg.controllers = start.controllers;

  Game g(build_board(start), cfg);
  g.settle_turn();
  return g;
}

Game Game::from_snapshot(const Snapshot& snap) {
  if (snap.turn_index < 0 || snap.turn_index >= ARMY_N)
    throw SnapshotError("snapshot: turn index out of range");

  Game g;
  g.config_ = snap.config;
  for (Army a : ALL_ARMIES) {
    for (PieceKind k : ALL_KINDS) g.board_.set_pieces(a, k, snap.pieces[idx(a)][idx(k)]);
    g.board_.set_army_state(a, snap.armies[idx(a)]);
    g.board_.set_promotion_zone(a, snap.promotion_zones[idx(a)]);
  }

  try {
    validate_turn_order(g.config_.turn_order);
    validate_disjoint(g.board_);
    validate_thrones(g.board_);
  } catch (const PositionError& e) {
    throw SnapshotError(std::string("snapshot: ") + e.what());
  }

  (void)ATT();
  g.state_.turn_index = snap.turn_index;
  g.state_.stalemated = snap.stalemated;
  g.refresh_derived();
  return g;
}

// ------------ the move ------------

MoveResult Game::apply_move(Army army, Square from, Square to, PieceKind promotion) {
  if (status() != GameStatus::Ongoing)
    return reject(MoveError::GameOver, "The game is over");

  if (army_is_frozen(army))
    return reject(MoveError::ArmyFrozen, std::string(army_name(army)) + " is frozen");

  if (army != current_army())
    return reject(MoveError::WrongTurn, std::string("It is not ") + army_name(army) + "'s turn");

  Army owner = army;
  PieceKind kind = PieceKind::Pawn;
  if (!on_board(from) || !board_.piece_at(from, &owner, &kind))
    return reject(MoveError::NoPieceAtSource, "No piece on " + square_name(from));

  if (owner != army)
    return reject(MoveError::ForeignPiece,
                  square_name(from) + " holds a " + army_name(owner) + " piece");

  if (!on_board(to))
    return reject(MoveError::IllegalDestination, "Destination is off the board");

  Army victim = army;
  PieceKind victim_kind = PieceKind::Pawn;
  const bool capture = board_.piece_at(to, &victim, &victim_kind);
  if (capture && victim == army)
    return reject(MoveError::SelfCapture, "Cannot capture own piece on " + square_name(to));

  const std::vector<Move> legal = legal_moves(army);
  const Move* chosen = nullptr;
  for (const auto& m : legal) {
    if (m.from == from && m.to == to) { chosen = &m; break; }
  }
  if (!chosen) {
    if (must_move_king(army) && kind != PieceKind::King)
      return reject(MoveError::IllegalDestination, "King must move while in check");
    return reject(MoveError::IllegalDestination,
                  square_name(from) + " to " + square_name(to) + " is not a legal move");
  }

  // Settle the promotion before touching anything
  const bool promotes = kind == PieceKind::Pawn && can_promote_at(army, to);
  const bool privileged = promotes && is_privileged_pawn(army);
  PieceKind promoted_to = PieceKind::Queen;
  if (promotes) {
    if (promotion == PieceKind::Pawn || promotion == PieceKind::King)
      return reject(MoveError::InvalidPromotionTarget,
                    std::string("Cannot promote to ") + kind_name(promotion));
    if (privileged) promoted_to = promotion;
  }

  const Move m = *chosen;
  const MoveRecord rec = do_move(board_, state_, m);

  bool seized = false;
  if (kind == PieceKind::King) seized = take_throne(army, to);
  if (promotes) promote_pawn(army, to, promoted_to, privileged);

  state_.sync_with_board(board_);
  update_all_stalemates();
  advance_turn();

  std::string msg = std::string(army_name(army)) + " moved " + kind_name(kind) + " "
                  + square_name(from) + " to " + square_name(to);
  if (rec.captured) {
    msg += std::string(", capturing ") + army_name(rec.victim) + " " + kind_name(rec.victim_kind);
    if (rec.victim_kind == PieceKind::King) msg += std::string(" (") + army_name(rec.victim) + " is frozen)";
  }
  if (seized) msg += std::string(", seizing the ") + army_name(ally_of(army)) + " throne";
  if (promotes) msg += std::string(", promoting to ") + kind_name(promoted_to);

  MoveResult r;
  r.ok = true;
  r.message = std::move(msg);
  return r;
}

void Game::promote_pawn(Army army, Square s, PieceKind target, bool privileged) {
  // A privileged pawn takes the slot of an existing piece of its kind
  if (privileged && board_.pieces(army, target)) board_.demote_piece_to_pawn(army, target);
  board_.remove_piece(army, PieceKind::Pawn, s);
  board_.place_piece(army, target, s);
}

// ------------ administrative ------------

void Game::capture_king(Army army) {
  remove_king(army);
  settle_turn();
}

void Game::restore_king_to_throne(Army army) {
  put_king_on_throne(army);
  settle_turn();
}

bool Game::exchange_prisoners(Army a, Army b) {
  if (a == b) return false;
  if (state_.king_square(a) != NO_SQUARE || state_.king_square(b) != NO_SQUARE) return false;

  const Square ta = board_.army_state(a).thrones[0];
  const Square tb = board_.army_state(b).thrones[0];
  if (ta == NO_SQUARE || tb == NO_SQUARE || ta == tb) return false;

  put_king_on_throne(a);
  put_king_on_throne(b);
  settle_turn();
  return true;
}

bool Game::seize_throne_at(Army army, Square s) {
  if (!take_throne(army, s)) return false;
  settle_turn();
  return true;
}

void Game::freeze_army(Army army) {
  set_frozen(army, true);
  settle_turn();
}

void Game::unfreeze_army(Army army) {
  set_frozen(army, false);
  settle_turn();
}

void Game::remove_king(Army army) {
  const Square k = board_.king_square(army);
  if (k != NO_SQUARE) board_.remove_piece(army, PieceKind::King, k);
  set_frozen(army, true);
  state_.king_sq[idx(army)] = NO_SQUARE;
}

void Game::put_king_on_throne(Army army) {
  const Square throne = board_.army_state(army).thrones[0];
  if (throne == NO_SQUARE)
    throw GameError(std::string(army_name(army)) + " has no throne");

  Army occ = army;
  PieceKind occ_kind = PieceKind::Pawn;
  if (board_.piece_at(throne, &occ, &occ_kind)) {
    if (occ_kind == PieceKind::King && occ != army) remove_king(occ);
    else board_.clear_square(throne);
  }

  const Square cur = board_.king_square(army);
  if (cur != NO_SQUARE) board_.remove_piece(army, PieceKind::King, cur);

  board_.place_piece(army, PieceKind::King, throne);
  state_.king_sq[idx(army)] = throne;
  set_frozen(army, false);
}

bool Game::take_throne(Army army, Square s) {
  const Army ally = ally_of(army);
  const auto& thrones = board_.army_state(ally).thrones;
  if (thrones[0] != s && thrones[1] != s) return false;

  board_.set_controller(ally, board_.controller(army));
  set_frozen(ally, false);
  return true;
}

void Game::set_frozen(Army army, bool frozen) {
  board_.set_frozen(army, frozen);
  state_.frozen[idx(army)] = frozen;
  if (frozen) state_.stalemated[idx(army)] = false;
}

void Game::settle_turn() {
  update_all_stalemates();
  const Army cur = current_army();
  if (army_is_frozen(cur) || army_in_stalemate(cur)) advance_turn();
}

void Game::advance_turn() {
  for (int i = 0; i < ARMY_N; ++i) {
    state_.turn_index = (state_.turn_index + 1) % ARMY_N;
    const Army next = current_army();
    if (!army_is_frozen(next) && !army_in_stalemate(next)) break;
  }
}

// Stuck with nothing to play, in check or not. The turn has to pass either way.
void Game::update_stalemate(Army army) {
  if (army_is_frozen(army)) {
    state_.stalemated[idx(army)] = false;
    return;
  }
  MoveList ml;
  generate_legal(board_, state_, army, ml);
  state_.stalemated[idx(army)] = ml.empty();
}

void Game::update_all_stalemates() {
  for (Army a : ALL_ARMIES) update_stalemate(a);
}

void Game::refresh_derived() {
  board_.refresh_occupancy();
  for (Army a : ALL_ARMIES) {
    state_.frozen[idx(a)] = board_.is_frozen(a);
    state_.king_sq[idx(a)] = board_.king_square(a);
  }
}

// ------------ queries ------------

std::vector<Move> Game::legal_moves(Army army) const {
  if (army_is_frozen(army)) return {};
  MoveList ml;
  generate_legal(board_, state_, army, ml);
  return std::vector<Move>(ml.begin(), ml.end());
}

bool Game::king_in_check(Army army) const {
  return enoch::king_in_check(board_, state_, army);
}

bool Game::must_move_king(Army army) const {
  return enoch::must_move_king(board_, state_, army);
}

ArmyStatus Game::army_status(Army army) const {
  ArmyStatus s;
  s.frozen = army_is_frozen(army);
  s.stalemated = army_in_stalemate(army);
  s.in_check = king_in_check(army);
  return s;
}

// King, at least one Pawn, and no more than one piece among
// Queen, Bishop, Knight and Rook.
bool Game::is_privileged_pawn(Army army) const {
  const auto c = piece_counts(army);
  if (c[idx(PieceKind::King)] == 0 || c[idx(PieceKind::Pawn)] == 0) return false;
  const int majors = c[idx(PieceKind::Queen)] + c[idx(PieceKind::Bishop)]
                   + c[idx(PieceKind::Knight)] + c[idx(PieceKind::Rook)];
  return majors <= 1;
}

std::vector<PieceKind> Game::promotion_targets(Army army) const {
  if (!is_privileged_pawn(army)) return {PieceKind::Queen};
  return {PieceKind::Queen, PieceKind::Rook, PieceKind::Bishop, PieceKind::Knight};
}

bool Game::can_promote_at(Army army, Square s) const {
  return on_board(s) && (board_.promotion_zone(army) & bit(s)) != 0;
}

bool Game::winning_team(Team* out) const {
  const int air = state_.kings_alive(Team::Air);
  const int earth = state_.kings_alive(Team::Earth);
  if (air > 0 && earth == 0) { if (out) *out = Team::Air; return true; }
  if (earth > 0 && air == 0) { if (out) *out = Team::Earth; return true; }
  return false;
}

// Nobody left, or one side whole against none
bool Game::draw_condition() const {
  const int air = state_.kings_alive(Team::Air);
  const int earth = state_.kings_alive(Team::Earth);
  if (air == 0 && earth == 0) return true;
  return (air == 0 && earth == 2) || (earth == 0 && air == 2);
}

GameStatus Game::status() const {
  Team t = Team::Air;
  if (winning_team(&t)) return t == Team::Air ? GameStatus::AirWins : GameStatus::EarthWins;
  if (draw_condition()) return GameStatus::Draw;
  return GameStatus::Ongoing;
}

Snapshot Game::snapshot() const {
  Snapshot s;
  for (Army a : ALL_ARMIES) {
    for (PieceKind k : ALL_KINDS) s.pieces[idx(a)][idx(k)] = board_.pieces(a, k);
    s.armies[idx(a)] = board_.army_state(a);
    s.promotion_zones[idx(a)] = board_.promotion_zone(a);
  }
  s.config = config_;
  s.turn_index = state_.turn_index;
  s.stalemated = state_.stalemated;
  return s;
}

} // namespace enoch
