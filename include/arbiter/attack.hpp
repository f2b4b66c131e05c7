#pragma once
#include "arbiter/position.hpp"

namespace arbiter {

// Does `attacker`, standing on `from`, attack `target`? Geometry only:
// occupancy blocks sliders, nothing else about the position is consulted.
bool attacks_square(const Position& b, Square from, Piece attacker, Square target);

// Is square s attacked by side 'by'?
bool square_attacked(const Position& b, Square s, Color by);

// Is 'side' currently in check? False when 'side' has no king.
bool in_check(const Position& b, Color side);

} // namespace arbiter
