#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "arbiter/game.hpp"
#include "arbiter/move.hpp"
#include "arbiter/policy.hpp"
#include "arbiter/position.hpp"

namespace arbiter {

struct GameReport {
  GameOutcome outcome = GameOutcome::Ongoing;  // Ongoing = stopped at the ply cap
  int plies = 0;                       // number of half-moves played
  std::string reason;                  // human-readable termination reason
  std::vector<Move> moves;             // played moves
  std::vector<std::string> san;        // same moves, rendered
  double seconds = 0.0;                // wall time spent in self-play loop
};

struct SelfPlayConfig {
  int games = 1;
  int maxPlies = 200;                  // stop early
  std::uint64_t seed = 1;              // seeds one source shared by all games
  bool printPerGame = true;            // print one-line result per game
};

struct SelfPlaySummary {
  int games = 0;
  int whiteWins = 0;
  int blackWins = 0;
  int draws = 0;
  int aborted = 0;                     // hit the ply cap

  std::uint64_t plies = 0;
  double seconds = 0.0;
};

// Both sides pick uniformly among legal moves until mate, stalemate or maxPlies.
GameReport selfplay_game(const Position& start, RandomSource& rng, int maxPlies);
SelfPlaySummary selfplay_many(const Position& start, const SelfPlayConfig& cfg);

} // namespace arbiter
