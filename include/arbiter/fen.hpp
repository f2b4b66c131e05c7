#pragma once
#include <string>
#include <string_view>
#include "arbiter/errors.hpp"
#include "arbiter/position.hpp"

namespace arbiter {

inline constexpr char STARTPOS_FEN[] =
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// Throws FormatError on malformed input.
Position from_fen(std::string_view fen);
std::string to_fen(const Position& b);

Position startpos();

char piece_to_char(Piece p);

} // namespace arbiter
