#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "arbiter/movelist.hpp"

namespace arbiter {

// Source of uniform choices; tests substitute a scripted one.
class RandomSource {
public:
  virtual ~RandomSource() = default;
  // Uniform index in [0, n). n > 0.
  virtual std::size_t pick(std::size_t n) = 0;
};

// Mix helper for deterministic RNG seeding
inline std::uint64_t splitmix64(std::uint64_t& x) {
  x += 0x9e3779b97f4a7c15ULL;
  std::uint64_t z = x;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

class SeededRandom : public RandomSource {
public:
  explicit SeededRandom(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state_(seed) {}
  std::size_t pick(std::size_t n) override;

private:
  std::uint64_t state_;
};

// Uniform choice among 'moves'; nullopt when there is nothing to play.
std::optional<Move> pick_random_move(const MoveList& moves, RandomSource& rng);

} // namespace arbiter
