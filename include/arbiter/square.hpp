#pragma once
#include <string>
#include <string_view>
#include "arbiter/types.hpp"

namespace arbiter {

// Display coordinates: row 0 is rank 8, col 0 is file a.
struct Coords {
  int row = 0;
  int col = 0;
  bool operator==(const Coords&) const = default;
};

// "e4" -> square index. Throws FormatError on anything else.
Square parse_square(std::string_view text);
std::string square_name(Square s);

Coords to_coords(Square s);
// Throws FormatError if (row, col) is off the board.
Square from_coords(int row, int col);

} // namespace arbiter
