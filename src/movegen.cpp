#include "arbiter/movegen.hpp"
#include "arbiter/attack.hpp"
#include "arbiter/types.hpp"
#include "arbiter/position.hpp"

namespace arbiter {

static constexpr int KN_DF[8] = {+1, +2, +2, +1, -1, -2, -2, -1};
static constexpr int KN_DR[8] = {+2, +1, -1, -2, -2, -1, +1, +2};
static constexpr int KG_DF[8] = {+1, +1,  0, -1, -1, -1,  0, +1};
static constexpr int KG_DR[8] = { 0, +1, +1, +1,  0, -1, -1, -1};

static constexpr int DFb[4] = {+1, +1, -1, -1};
static constexpr int DRb[4] = {+1, -1, +1, -1};
static constexpr int DFr[4] = {+1, -1,  0,  0}; // E, W,  -,  -
static constexpr int DRr[4] = { 0,  0, +1, -1}; // -,  -,  N,  S

// Empty or enemy-occupied: a target a non-pawn may land on.
static inline bool can_land(const Position& b, Square t, Color us) {
  const Piece p = b.piece_at(t);
  return p.empty() || p.color != us;
}

static void gen_steps(const Position& b, Square s, Color us,
                      const int* DF, const int* DR, int n, SquareList& out) {
  const int f0 = file_of(s), r0 = rank_of(s);
  for (int i = 0; i < n; ++i) {
    const int f = f0 + DF[i], r = r0 + DR[i];
    if (!on_board(f, r)) continue;
    const Square t = make_square(f, r);
    if (can_land(b, t, us)) out.push(t);
  }
}

static void gen_rays(const Position& b, Square s, Color us,
                     const int* DF, const int* DR, SquareList& out) {
  const int f0 = file_of(s), r0 = rank_of(s);
  for (int dir = 0; dir < 4; ++dir) {
    int f = f0 + DF[dir], r = r0 + DR[dir];
    while (on_board(f, r)) {
      const Square t = make_square(f, r);
      const Piece op = b.piece_at(t);
      if (op.empty()) {
        out.push(t);
      } else {
        if (op.color != us) out.push(t);
        break; // blocked
      }
      f += DF[dir]; r += DR[dir];
    }
  }
}

static void gen_pawn(const Position& b, Square s, Color us, SquareList& out) {
  const int f0 = file_of(s), r0 = rank_of(s);
  const int dir = pawn_dir(us);

  // pushes
  if (on_board(f0, r0 + dir)) {
    const Square one = make_square(f0, r0 + dir);
    if (b.piece_at(one).empty()) {
      out.push(one);
      if (r0 == pawn_home_rank(us)) {
        const Square two = make_square(f0, r0 + 2 * dir);
        if (b.piece_at(two).empty()) out.push(two);
      }
    }
  }

  // captures, en passant included
  const Square ep = b.ep_square();
  for (int df : {-1, +1}) {
    const int f = f0 + df, r = r0 + dir;
    if (!on_board(f, r)) continue;
    const Square t = make_square(f, r);
    const Piece op = b.piece_at(t);
    if (!op.empty() && op.color != us) out.push(t);
    else if (op.empty() && t == ep) out.push(t);
  }
}

static void gen_castles(const Position& b, Square s, Color us, SquareList& out) {
  const int home = (us == Color::White ? 0 : 7);
  if (s != make_square(4, home)) return;

  const Castling cr = b.castling();
  const unsigned kside = (us == Color::White ? Castling::WhiteKing : Castling::BlackKing);
  const unsigned qside = (us == Color::White ? Castling::WhiteQueen : Castling::BlackQueen);
  if (!cr.has(kside) && !cr.has(qside)) return;

  const Color opp = other(us);
  if (square_attacked(b, s, opp)) return; // no castling out of check

  auto own_rook_on = [&](int file) {
    const Piece p = b.piece_at(make_square(file, home));
    return p.type == PieceType::Rook && p.color == us;
  };
  auto empty_at = [&](int file) { return b.piece_at(make_square(file, home)).empty(); };
  auto safe_at  = [&](int file) { return !square_attacked(b, make_square(file, home), opp); };

  // O-O: f and g empty, f and g unattacked
  if (cr.has(kside) && own_rook_on(7) && empty_at(5) && empty_at(6) &&
      safe_at(5) && safe_at(6)) {
    out.push(make_square(6, home));
  }
  // O-O-O: b, c and d empty, only d and c need to be unattacked
  if (cr.has(qside) && own_rook_on(0) && empty_at(1) && empty_at(2) && empty_at(3) &&
      safe_at(3) && safe_at(2)) {
    out.push(make_square(2, home));
  }
}

void generate_pseudo_legal(const Position& b, Square from, SquareList& out) {
  out.clear();

  const Piece pc = b.piece_at(from);
  const Color us = pc.color;

  switch (pc.type) {
    case PieceType::Pawn:
      gen_pawn(b, from, us, out);
      break;
    case PieceType::Knight:
      gen_steps(b, from, us, KN_DF, KN_DR, 8, out);
      break;
    case PieceType::Bishop:
      gen_rays(b, from, us, DFb, DRb, out);
      break;
    case PieceType::Rook:
      gen_rays(b, from, us, DFr, DRr, out);
      break;
    case PieceType::Queen:
      gen_rays(b, from, us, DFb, DRb, out);
      gen_rays(b, from, us, DFr, DRr, out);
      break;
    case PieceType::King:
      gen_steps(b, from, us, KG_DF, KG_DR, 8, out);
      gen_castles(b, from, us, out);
      break;
    case PieceType::None:
      break;
  }
}

} // namespace arbiter
