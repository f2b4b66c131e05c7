#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "arbiter/fen.hpp"
#include "arbiter/move.hpp"
#include "arbiter/position.hpp"
#include "arbiter/status.hpp"

namespace arbiter {

enum class GameOutcome { Ongoing, WhiteWin, BlackWin, Draw };

struct MoveRecord {
  Move move;             // as played, promotion resolved
  std::string san;
  std::string fen_after;
};

// One game lineage: the start position, the current position and the moves
// that lead from one to the other. Only legal moves are ever played.
class Game {
public:
  explicit Game(Position start = startpos());

  const Position& start() const { return start_; }
  const Position& position() const { return pos_; }
  const std::vector<MoveRecord>& history() const { return history_; }

  // False (and nothing changes) if the move is illegal or the game is over.
  bool play(const Move& m);
  // Throws FormatError on malformed text.
  bool play_uci(std::string_view uci);

  GameStatus status() const { return status_; }
  bool in_check() const;
  bool is_over() const { return status_ != GameStatus::Ongoing; }
  GameOutcome outcome() const;

  // "White's Turn", "Black's Turn (Check!)", "Checkmate! White wins.", ...
  std::string status_text() const;

private:
  Position start_;
  Position pos_;
  GameStatus status_;
  std::vector<MoveRecord> history_;
};

const char* outcome_name(GameOutcome o);

} // namespace arbiter
