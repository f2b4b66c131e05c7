#include "arbiter/legal.hpp"
#include "arbiter/attack.hpp"
#include "arbiter/move_apply.hpp"
#include "arbiter/movegen.hpp"

namespace arbiter {

static constexpr PieceType PROMOS[4] = {
  PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight
};

static bool leaves_king_safe(const Position& b, Square from, Square to, Color us) {
  // apply_move promotes to a queen when no piece is given
  const AppliedMove am = apply_move(b, Move{from, to, PieceType::None});
  return !in_check(am.position, us);
}

SquareList legal_destinations(const Position& b, Square from) {
  SquareList out;
  if (from < 0 || from >= 64) return out;

  const Piece pc = b.piece_at(from);
  const Color us = b.side_to_move();
  if (pc.empty() || pc.color != us) return out;

  SquareList cand;
  generate_pseudo_legal(b, from, cand);
  for (Square to : cand) {
    if (leaves_king_safe(b, from, to, us)) out.push(to);
  }
  return out;
}

bool is_legal(const Position& b, const Move& m) {
  if (m.promo == PieceType::Pawn || m.promo == PieceType::King) return false;
  if (m.from < 0 || m.from >= 64 || m.to < 0 || m.to >= 64) return false;
  if (m.promo != PieceType::None) {
    const Piece pc = b.piece_at(m.from);
    if (pc.type != PieceType::Pawn || rank_of(m.to) != last_rank(pc.color)) return false;
  }
  return legal_destinations(b, m.from).contains(m.to);
}

void generate_legal(const Position& b, MoveList& out) {
  out.clear();
  const Color us = b.side_to_move();
  for (Square s = 0; s < 64; ++s) {
    const Piece pc = b.piece_at(s);
    if (pc.empty() || pc.color != us) continue;

    const SquareList dests = legal_destinations(b, s);
    const bool pawn = pc.type == PieceType::Pawn;
    for (Square to : dests) {
      if (pawn && rank_of(to) == last_rank(us)) {
        for (PieceType p : PROMOS) out.push(Move{s, to, p});
      } else {
        out.push(Move{s, to, PieceType::None});
      }
    }
  }
}

void generate_legal_pairs(const Position& b, MoveList& out) {
  out.clear();
  const Color us = b.side_to_move();
  for (Square s = 0; s < 64; ++s) {
    const Piece pc = b.piece_at(s);
    if (pc.empty() || pc.color != us) continue;
    for (Square to : legal_destinations(b, s)) out.push(Move{s, to, PieceType::None});
  }
}

} // namespace arbiter
