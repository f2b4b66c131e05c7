#pragma once
#include "arbiter/move.hpp"
#include "arbiter/position.hpp"

namespace arbiter {

// Outcome of applying one move: the next position plus what the move did.
struct AppliedMove {
  Position position;                 // position after the move
  Move     move;                     // as played, promotion resolved
  Piece    moved;                    // piece that moved (pre-promo)
  Piece    captured;                 // captured piece (empty if none)
  Square   captured_sq{NO_SQUARE};   // where the captured piece sat
  MoveFlag flags{MoveFlag::Quiet};

  bool is_capture() const { return has_flag(flags, MoveFlag::Capture); }
  bool is_en_passant() const { return has_flag(flags, MoveFlag::EnPassant); }
  bool is_castle_kingside() const { return has_flag(flags, MoveFlag::CastleKing); }
  bool is_castle_queenside() const { return has_flag(flags, MoveFlag::CastleQueen); }
  bool is_promotion() const { return has_flag(flags, MoveFlag::Promotion); }
};

// Applies m to b without checking legality; b itself is left untouched.
// A pawn reaching its last rank with no promotion given becomes a queen.
// Throws IllegalStateError if 'm.from' is empty, a square is off the
// board, or the promotion type is a pawn or a king.
AppliedMove apply_move(const Position& b, const Move& m);

} // namespace arbiter
