#include "arbiter/square.hpp"
#include "arbiter/errors.hpp"

namespace arbiter {

Square parse_square(std::string_view text) {
  if (text.size() != 2) throw FormatError("Invalid square: '" + std::string(text) + "'");
  const int file = text[0] - 'a';
  const int rank = text[1] - '1';
  if (!on_board(file, rank)) throw FormatError("Invalid square: '" + std::string(text) + "'");
  return make_square(file, rank);
}

std::string square_name(Square s) {
  std::string out;
  out += char('a' + file_of(s));
  out += char('1' + rank_of(s));
  return out;
}

Coords to_coords(Square s) {
  return Coords{7 - rank_of(s), file_of(s)};
}

Square from_coords(int row, int col) {
  if (row < 0 || row > 7 || col < 0 || col > 7)
    throw FormatError("Coordinates out of range: (" + std::to_string(row) + ", " + std::to_string(col) + ")");
  return make_square(col, 7 - row);
}

} // namespace arbiter
