#include "arbiter/game.hpp"

#include "arbiter/attack.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/move_apply.hpp"
#include "arbiter/notation.hpp"
#include "arbiter/uci.hpp"

#include <utility>

namespace arbiter {
namespace {

static inline const char* color_name(Color c) {
  return c == Color::White ? "White" : "Black";
}

} // namespace

Game::Game(Position start)
  : start_(std::move(start)), pos_(start_), status_(game_status(pos_)) {}

bool Game::play(const Move& m) {
  if (is_over()) return false;
  if (!is_legal(pos_, m)) return false;

  AppliedMove am = apply_move(pos_, m);
  MoveRecord rec;
  rec.move = am.move;
  rec.san = to_san(am);
  rec.fen_after = to_fen(am.position);

  pos_ = std::move(am.position);
  status_ = game_status(pos_);
  history_.push_back(std::move(rec));
  return true;
}

bool Game::play_uci(std::string_view uci) {
  return play(uci_to_move(uci));
}

bool Game::in_check() const {
  return arbiter::in_check(pos_, pos_.side_to_move());
}

GameOutcome Game::outcome() const {
  switch (status_) {
    case GameStatus::Ongoing:   return GameOutcome::Ongoing;
    case GameStatus::Stalemate: return GameOutcome::Draw;
    case GameStatus::Checkmate:
      // the side to move is mated
      return pos_.side_to_move() == Color::White ? GameOutcome::BlackWin : GameOutcome::WhiteWin;
  }
  return GameOutcome::Ongoing;
}

std::string Game::status_text() const {
  const Color stm = pos_.side_to_move();
  switch (status_) {
    case GameStatus::Checkmate:
      return std::string("Checkmate! ") + color_name(other(stm)) + " wins.";
    case GameStatus::Stalemate:
      return "Stalemate! It's a draw.";
    case GameStatus::Ongoing:
      break;
  }
  std::string s = std::string(color_name(stm)) + "'s Turn";
  if (in_check()) s += " (Check!)";
  return s;
}

const char* outcome_name(GameOutcome o) {
  switch (o) {
    case GameOutcome::Ongoing:  return "ongoing";
    case GameOutcome::WhiteWin: return "1-0";
    case GameOutcome::BlackWin: return "0-1";
    case GameOutcome::Draw:     return "1/2-1/2";
  }
  return "ongoing";
}

} // namespace arbiter
