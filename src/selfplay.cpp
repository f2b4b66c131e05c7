#include "arbiter/selfplay.hpp"

#include <chrono>
#include <iostream>

#include "arbiter/legal.hpp"
#include "arbiter/uci.hpp"

namespace arbiter {

GameReport selfplay_game(const Position& start, RandomSource& rng, int maxPlies) {
  using clock = std::chrono::steady_clock;

  GameReport rep;
  Game game(start);

  if (maxPlies < 0) maxPlies = 0;
  const auto t0 = clock::now();

  for (int ply = 0; ply < maxPlies && !game.is_over(); ++ply) {
    MoveList ml;
    generate_legal_pairs(game.position(), ml);

    // Ongoing positions always have a move to pick.
    const auto m = pick_random_move(ml, rng);
    if (!m || !game.play(*m)) {
      rep.reason = "no legal move selectable (internal error)";
      break;
    }
    rep.moves.push_back(game.history().back().move);
    rep.san.push_back(game.history().back().san);
  }

  rep.plies = static_cast<int>(rep.moves.size());
  rep.outcome = game.outcome();

  if (rep.reason.empty()) {
    switch (game.status()) {
      case GameStatus::Checkmate: rep.reason = "checkmate"; break;
      case GameStatus::Stalemate: rep.reason = "stalemate"; break;
      case GameStatus::Ongoing:   rep.reason = "max plies reached"; break;
    }
  }

  const auto t1 = clock::now();
  rep.seconds = std::chrono::duration<double>(t1 - t0).count();
  return rep;
}

SelfPlaySummary selfplay_many(const Position& start, const SelfPlayConfig& cfg) {
  SelfPlaySummary sum;
  sum.games = cfg.games;

  SeededRandom rng(cfg.seed);

  for (int i = 0; i < cfg.games; ++i) {
    GameReport rep = selfplay_game(start, rng, cfg.maxPlies);

    sum.plies += static_cast<std::uint64_t>(rep.plies);
    sum.seconds += rep.seconds;

    switch (rep.outcome) {
      case GameOutcome::WhiteWin: ++sum.whiteWins; break;
      case GameOutcome::BlackWin: ++sum.blackWins; break;
      case GameOutcome::Draw:     ++sum.draws;     break;
      case GameOutcome::Ongoing:  ++sum.aborted;   break;
    }

    if (cfg.printPerGame) {
      std::cout << "game " << (i + 1)
                << " result " << outcome_name(rep.outcome)
                << " plies " << rep.plies
                << " (" << rep.reason << ")";
      if (!rep.moves.empty()) std::cout << " last " << move_to_uci(rep.moves.back());
      std::cout << "\n";
    }
  }

  return sum;
}

} // namespace arbiter
