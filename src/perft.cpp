#include "arbiter/perft.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/move_apply.hpp"
#include "arbiter/movelist.hpp"

namespace arbiter {

std::uint64_t perft(const Position& b, int depth) {
  if (depth <= 0) return 1ULL;

  MoveList ml;
  generate_legal(b, ml);
  if (depth == 1) return static_cast<std::uint64_t>(ml.size());

  std::uint64_t nodes = 0ULL;
  for (const auto& m : ml) {
    nodes += perft(apply_move(b, m).position, depth - 1);
  }
  return nodes;
}

void perft_divide(const Position& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0) return;

  MoveList ml;
  generate_legal(b, ml);
  for (const auto& m : ml) {
    out.emplace_back(m, perft(apply_move(b, m).position, depth - 1));
  }
}

} // namespace arbiter
