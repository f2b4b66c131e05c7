#include "arbiter/notation.hpp"
#include "arbiter/attack.hpp"
#include "arbiter/square.hpp"
#include "arbiter/status.hpp"

namespace arbiter {

static inline char piece_letter(PieceType p) {
  switch (p) {
    case PieceType::Knight: return 'N';
    case PieceType::Bishop: return 'B';
    case PieceType::Rook:   return 'R';
    case PieceType::Queen:  return 'Q';
    case PieceType::King:   return 'K';
    case PieceType::Pawn:
    case PieceType::None:   return '\0';
  }
  return '\0';
}

static std::string check_suffix(const Position& after) {
  const GameStatus st = game_status(after);
  if (st == GameStatus::Checkmate) return "#";
  if (in_check(after, after.side_to_move())) return "+";
  return "";
}

std::string to_san(const AppliedMove& a) {
  std::string s;

  if (a.is_castle_kingside()) {
    s = "O-O";
  } else if (a.is_castle_queenside()) {
    s = "O-O-O";
  } else {
    if (a.moved.type == PieceType::Pawn) {
      if (a.is_capture()) s += char('a' + file_of(a.move.from));
    } else {
      s += piece_letter(a.moved.type);
    }
    if (a.is_capture()) s += 'x';
    s += square_name(a.move.to);
    if (a.is_promotion()) {
      s += '=';
      s += piece_letter(a.move.promo);
    }
  }

  s += check_suffix(a.position);
  return s;
}

} // namespace arbiter
