#include "arbiter/policy.hpp"

namespace arbiter {

std::size_t SeededRandom::pick(std::size_t n) {
  const std::uint64_t range = static_cast<std::uint64_t>(n);
  // reject the short tail so every index is equally likely
  const std::uint64_t limit = ~std::uint64_t{0} - (~std::uint64_t{0} % range);
  std::uint64_t v = splitmix64(state_);
  while (v >= limit) v = splitmix64(state_);
  return static_cast<std::size_t>(v % range);
}

std::optional<Move> pick_random_move(const MoveList& moves, RandomSource& rng) {
  if (moves.empty()) return std::nullopt;
  std::size_t i = rng.pick(moves.size());
  if (i >= moves.size()) i = moves.size() - 1;
  return moves[i];
}

} // namespace arbiter
