#include "arbiter/position.hpp"


namespace arbiter {


Position::Position() { clear(); }


void Position::clear() {
for (auto& p : squares_) p = Piece{};
stm_ = Color::White;
castling_ = {};
ep_square_ = NO_SQUARE;
halfmove_ = 0;
fullmove_ = 1;
}


Square Position::king_square(Color c) const {
  for (Square s = 0; s < 64; ++s) {
    const Piece p = piece_at(s);
    if (p.type == PieceType::King && p.color == c) return s;
  }
  return NO_SQUARE;
}


} // namespace arbiter
