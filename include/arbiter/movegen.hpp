#pragma once
#include "arbiter/position.hpp"
#include "arbiter/movelist.hpp"


namespace arbiter {


// Candidate destinations for the piece on 'from', king safety not checked.
// Castling candidates are included for a king on its home square and are
// already vetted for rights, an empty path and unattacked transit squares.
// 'out' is cleared first; an empty square yields no candidates.
void generate_pseudo_legal(const Position& b, Square from, SquareList& out);


} // namespace arbiter
