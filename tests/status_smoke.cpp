#include <cassert>
#include <string>
#include "arbiter/fen.hpp"
#include "arbiter/game.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/status.hpp"

int main() {
  using namespace arbiter;

  // Initial position: twenty moves, game on
  {
    const Position b = startpos();
    MoveList ml;
    generate_legal(b, ml);
    assert(ml.size() == 20);

    std::size_t n = 0;
    for (Square s = 0; s < 64; ++s) n += legal_destinations(b, s).size();
    assert(n == 20);

    assert(game_status(b) == GameStatus::Ongoing);
    assert(has_any_legal_move(b));
  }

  // Fool's mate
  {
    Game g;
    for (const char* m : {"f2f3", "e7e5", "g2g4", "d8h4"}) assert(g.play_uci(m));
    assert(g.status() == GameStatus::Checkmate);
    assert(g.in_check());
    assert(g.is_over());
    assert(g.outcome() == GameOutcome::BlackWin);
    assert(g.position().side_to_move() == Color::White);
    assert(g.history().back().san == "Qh4#");
    assert(game_status(g.position()) == GameStatus::Checkmate);  // repeatable
    assert(game_status(g.position()) == GameStatus::Checkmate);
    assert(std::string(status_name(g.status())) == "checkmate");
  }

  // Back-rank mate for White
  {
    Game g(from_fen("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1"));
    assert(g.play_uci("a1a8"));
    assert(g.status() == GameStatus::Checkmate);
    assert(g.outcome() == GameOutcome::WhiteWin);
    assert(g.history().back().san == "Ra8#");
  }

  // Stalemates: not in check, nothing to play
  {
    Position b1 = from_fen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    assert(game_status(b1) == GameStatus::Stalemate);
    assert(!has_any_legal_move(b1));

    Position b2 = from_fen("8/8/8/8/8/kq6/8/K7 w - - 0 1");
    assert(game_status(b2) == GameStatus::Stalemate);
    assert(std::string(status_name(game_status(b2))) == "stalemate");

    Game g(b2);
    assert(g.is_over());
    assert(g.outcome() == GameOutcome::Draw);
  }

  // In check but with an escape
  {
    Position b = from_fen("4k3/8/8/8/8/8/4r3/4K3 w - - 0 1");
    assert(game_status(b) == GameStatus::Ongoing);
  }

  return 0;
}
