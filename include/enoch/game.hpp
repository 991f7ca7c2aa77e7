#pragma once

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

#include "enoch/board.hpp"
#include "enoch/game_state.hpp"
#include "enoch/move.hpp"
#include "enoch/position.hpp"
#include "enoch/snapshot.hpp"

namespace enoch {

struct GameError : std::runtime_error { using std::runtime_error::runtime_error; };

// Why apply_move turned a move down. Checked in this order.
enum class MoveError {
  None,
  GameOver,
  ArmyFrozen,
  WrongTurn,
  NoPieceAtSource,
  ForeignPiece,
  SelfCapture,
  IllegalDestination,
  InvalidPromotionTarget,
};

const char* move_error_name(MoveError e);

struct MoveResult {
  bool ok = false;
  MoveError error = MoveError::None;
  std::string message;   // confirmation on success, reason on failure

  explicit operator bool() const { return ok; }
};

enum class GameStatus { Ongoing, AirWins, EarthWins, Draw };

// stalemated means the army is unfrozen and has no legal move. That includes
// an army stuck in check, so stalemated and in_check can both be set.
struct ArmyStatus {
  bool frozen = false;
  bool stalemated = false;
  bool in_check = false;
};

class Game {
public:
  // Throws PositionError on a bad turn order or overlapping masks.
  Game(const Board& board, const GameConfig& config);

  static Game from_starting_position(const StartingPosition& start);
  static Game from_snapshot(const Snapshot& snap);

  // The only way a player changes the position. A rejected move leaves
  // everything as it was.
  MoveResult apply_move(Army army, Square from, Square to,
                        PieceKind promotion = PieceKind::Queen);

  // Administrative operations. The ones that change the position recompute
  // stalemates and pass the turn on when the current army can no longer play.
  void capture_king(Army army);
  void restore_king_to_throne(Army army);   // throws GameError if the army has no throne
  bool exchange_prisoners(Army a, Army b);
  bool seize_throne_at(Army army, Square s);
  void freeze_army(Army army);
  void unfreeze_army(Army army);
  void advance_turn();
  void update_stalemate(Army army);
  void update_all_stalemates();
  void refresh_derived();

  // Queries
  Army current_army() const { return config_.turn_order[static_cast<std::size_t>(state_.turn_index)]; }
  std::vector<Move> legal_moves(Army army) const;
  bool army_is_frozen(Army army) const { return state_.frozen[idx(army)]; }
  bool army_in_stalemate(Army army) const { return state_.stalemated[idx(army)]; }
  bool king_in_check(Army army) const;
  bool must_move_king(Army army) const;
  ArmyStatus army_status(Army army) const;

  std::array<int, KIND_N> piece_counts(Army army) const { return board_.piece_counts(army); }
  bool is_privileged_pawn(Army army) const;
  std::vector<PieceKind> promotion_targets(Army army) const;
  bool can_promote_at(Army army, Square s) const;

  bool winning_team(Team* out) const;
  bool draw_condition() const;
  GameStatus status() const;

  std::vector<std::string> ascii_rows() const { return board_.ascii_rows(); }
  Snapshot snapshot() const;

  const Board& board() const { return board_; }
  const GameState& state() const { return state_; }
  const GameConfig& config() const { return config_; }

  // Raw access. Call refresh_derived() after editing.
  Board& board_mut() { return board_; }
  GameState& state_mut() { return state_; }

private:
  Game() = default;

  void promote_pawn(Army army, Square s, PieceKind target, bool privileged);

  // Raw edits behind the administrative operations; no stalemate or turn upkeep
  void remove_king(Army army);
  void put_king_on_throne(Army army);
  bool take_throne(Army army, Square s);
  void set_frozen(Army army, bool frozen);

  // Recompute every stalemate flag, then pass the turn on if the current
  // army is frozen or stalemated.
  void settle_turn();

  Board board_;
  GameState state_;
  GameConfig config_;
};

} // namespace enoch
