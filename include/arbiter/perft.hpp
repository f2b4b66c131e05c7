#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "arbiter/move.hpp"
#include "arbiter/position.hpp"

namespace arbiter {

// Leaf count of the legal move tree, promotions counted per piece.
std::uint64_t perft(const Position& b, int depth);

// Per-move breakdown at root
void perft_divide(const Position& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out);

} // namespace arbiter
