#include "arbiter/attack.hpp"
#include "arbiter/types.hpp"
#include "arbiter/position.hpp"
#include <cstdlib>

namespace arbiter {

static inline int sign(int v) { return (v > 0) - (v < 0); }

// Squares strictly between 'from' and 'target' on a shared line are all
// empty. Callers guarantee the two squares share a rank, file or diagonal.
static bool line_clear(const Position& b, Square from, Square target) {
  const int sf = sign(file_of(target) - file_of(from));
  const int sr = sign(rank_of(target) - rank_of(from));
  int f = file_of(from) + sf, r = rank_of(from) + sr;
  while (make_square(f, r) != target) {
    if (!b.piece_at(make_square(f, r)).empty()) return false;
    f += sf; r += sr;
  }
  return true;
}

bool attacks_square(const Position& b, Square from, Piece attacker, Square target) {
  if (from == target) return false;

  const int df = file_of(target) - file_of(from);
  const int dr = rank_of(target) - rank_of(from);
  const int adf = std::abs(df), adr = std::abs(dr);

  switch (attacker.type) {
    case PieceType::Pawn:
      return dr == pawn_dir(attacker.color) && adf == 1;
    case PieceType::Knight:
      return (adf == 1 && adr == 2) || (adf == 2 && adr == 1);
    case PieceType::Bishop:
      return adf == adr && line_clear(b, from, target);
    case PieceType::Rook:
      return (df == 0 || dr == 0) && line_clear(b, from, target);
    case PieceType::Queen:
      return (adf == adr || df == 0 || dr == 0) && line_clear(b, from, target);
    case PieceType::King:
      return adf <= 1 && adr <= 1;
    case PieceType::None:
      return false;
  }
  return false;
}

bool square_attacked(const Position& b, Square s, Color by) {
  for (Square q = 0; q < 64; ++q) {
    const Piece p = b.piece_at(q);
    if (p.empty() || p.color != by) continue;
    if (attacks_square(b, q, p, s)) return true;
  }
  return false;
}

bool in_check(const Position& b, Color side) {
  const Square ks = b.king_square(side);
  if (ks == NO_SQUARE) return false; // fail-safe
  return square_attacked(b, ks, other(side));
}

} // namespace arbiter
