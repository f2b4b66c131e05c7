#include "arbiter/move_apply.hpp"
#include "arbiter/errors.hpp"
#include "arbiter/square.hpp"
#include <cstdlib>
#include <limits>
#include <string>

namespace arbiter {

static inline bool valid_square(Square s) { return s >= 0 && s < 64; }

// Rook home squares and the castling right each one guards.
static constexpr Square A1 = 0, H1 = 7, A8 = 56, H8 = 63;

static inline void clear_rights_for_square(unsigned& r, Square s) {
  if (s == H1) r &= ~Castling::WhiteKing;
  if (s == A1) r &= ~Castling::WhiteQueen;
  if (s == H8) r &= ~Castling::BlackKing;
  if (s == A8) r &= ~Castling::BlackQueen;
}

// clocks stop at INT_MAX instead of wrapping
static inline int bump(int n) {
  return n < std::numeric_limits<int>::max() ? n + 1 : n;
}

static inline void clear_rights_for_king(unsigned& r, Color side) {
  if (side == Color::White) r &= ~(Castling::WhiteKing | Castling::WhiteQueen);
  else                      r &= ~(Castling::BlackKing | Castling::BlackQueen);
}

AppliedMove apply_move(const Position& b, const Move& m) {
  if (!valid_square(m.from) || !valid_square(m.to))
    throw IllegalStateError("Move square off the board");

  const Piece srcP = b.piece_at(m.from);
  if (srcP.empty())
    throw IllegalStateError("No piece at from square: " + square_name(m.from));
  if (m.promo == PieceType::Pawn || m.promo == PieceType::King)
    throw IllegalStateError("Cannot promote to pawn or king");

  const Color us = srcP.color;

  AppliedMove out;
  out.position = b;
  out.move = m;
  out.moved = srcP;

  Position& nb = out.position;
  const int df = file_of(m.to) - file_of(m.from);
  const int dr = rank_of(m.to) - rank_of(m.from);

  // EP capture: the victim sits one rank behind the destination
  const bool is_ep = srcP.type == PieceType::Pawn && m.to == b.ep_square() &&
                     df != 0 && b.piece_at(m.to).empty();
  if (is_ep) {
    const Square cap_sq = m.to - 8 * pawn_dir(us);
    out.captured    = b.piece_at(cap_sq);
    out.captured_sq = cap_sq;
    out.flags |= MoveFlag::EnPassant;
    nb.remove_piece(cap_sq);
  } else if (!b.piece_at(m.to).empty()) {
    out.captured    = b.piece_at(m.to);
    out.captured_sq = m.to;
  }
  if (!out.captured.empty()) out.flags |= MoveFlag::Capture;

  // move (with promotion if any)
  nb.remove_piece(m.from);
  Piece placed = srcP;
  if (srcP.type == PieceType::Pawn && rank_of(m.to) == last_rank(us)) {
    placed.type = (m.promo != PieceType::None ? m.promo : PieceType::Queen);
    out.move.promo = placed.type;
    out.flags |= MoveFlag::Promotion;
  } else {
    out.move.promo = PieceType::None;
  }
  nb.set_piece(m.to, placed);

  // castling: king two files sideways drags the rook along
  if (srcP.type == PieceType::King && std::abs(df) == 2 && dr == 0) {
    const int home = rank_of(m.from);
    const int rook_from = (df > 0 ? 7 : 0);
    const int rook_to   = (df > 0 ? 5 : 3);
    const Square rf = make_square(rook_from, home);
    nb.set_piece(make_square(rook_to, home), b.piece_at(rf));
    nb.remove_piece(rf);
    out.flags |= (df > 0 ? MoveFlag::CastleKing : MoveFlag::CastleQueen);
  }

  // castling rights (mover + possibly captured rook)
  unsigned r = b.castling().rights;
  if (srcP.type == PieceType::King) clear_rights_for_king(r, us);
  clear_rights_for_square(r, m.from);
  clear_rights_for_square(r, m.to);
  Castling cr{}; cr.rights = r; nb.set_castling(cr);

  // EP square after double push
  nb.set_ep_square(NO_SQUARE);
  if (srcP.type == PieceType::Pawn && std::abs(dr) == 2 && df == 0) {
    nb.set_ep_square((m.from + m.to) / 2);
    out.flags |= MoveFlag::DoublePush;
  }

  // halfmove clock
  if (out.is_capture() || srcP.type == PieceType::Pawn) nb.set_halfmove_clock(0);
  else nb.set_halfmove_clock(bump(b.halfmove_clock()));

  // fullmove after Black
  if (us == Color::Black) nb.set_fullmove_number(bump(b.fullmove_number()));

  nb.set_side_to_move(other(us));
  return out;
}

} // namespace arbiter
