#pragma once
#include "arbiter/move.hpp"
#include "arbiter/movelist.hpp"
#include "arbiter/position.hpp"

namespace arbiter {

// Legal destinations of the piece on 'from'. Empty if the square is empty
// or holds a piece of the side not to move.
SquareList legal_destinations(const Position& b, Square from);

// m.to is a legal destination of m.from for the side to move. A promotion
// piece is accepted only on a pawn move to its last rank.
bool is_legal(const Position& b, const Move& m);

// Every legal move of the side to move. Promotions expand to Q, R, B, N.
void generate_legal(const Position& b, MoveList& out);

// One move per legal (from, to) pair, promo left as None so a promoting
// pawn becomes a queen when applied. This is the random policy's list.
void generate_legal_pairs(const Position& b, MoveList& out);

} // namespace arbiter
