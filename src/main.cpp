#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>

#include "arbiter/types.hpp"
#include "arbiter/fen.hpp"
#include "arbiter/game.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/perft.hpp"
#include "arbiter/selfplay.hpp"
#include "arbiter/square.hpp"
#include "arbiter/status.hpp"
#include "arbiter/uci.hpp"

using namespace arbiter;

static void usage() {
  std::cout <<
    "Arbiter CLI\n"
    "Usage:\n"
    "  arbiter_cli perft <depth> [fen...]\n"
    "  arbiter_cli divide <depth> [fen...]\n"
    "  arbiter_cli moves [square] [fen...]\n"
    "  arbiter_cli status [fen...]\n"
    "  arbiter_cli play <move> [move...]      (coordinate moves from startpos)\n"
    "  arbiter_cli selfplay [games <N>] [plies <N>] [seed <N>] [quiet]\n"
    "                       [fen <FEN...>]\n"
    "If FEN omitted, uses startpos.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static Position position_from_args(const std::vector<std::string>& a, size_t fenStart) {
  if (fenStart < a.size()) return from_fen(join_from(a, fenStart));
  return startpos();
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

static std::uint64_t to_u64(const std::string& s) {
  return static_cast<std::uint64_t>(std::stoull(s));
}

static bool looks_like_square(const std::string& s) {
  return s.size() == 2 && s[0] >= 'a' && s[0] <= 'h' && s[1] >= '1' && s[1] <= '8';
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // perft <depth> [fen...]
  if (cmd == "perft") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    const Position b = position_from_args(args, 2);
    std::cout << perft(b, depth) << "\n";
    return 0;
  }

  // divide <depth> [fen...]
  if (cmd == "divide") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    const Position b = position_from_args(args, 2);
    std::vector<std::pair<Move, std::uint64_t>> parts;
    perft_divide(b, depth, parts);
    std::uint64_t total = 0;
    for (auto& [m, n] : parts) {
      std::cout << move_to_uci(m) << " " << n << "\n";
      total += n;
    }
    std::cout << "total " << total << "\n";
    return 0;
  }

  // moves [square] [fen...]
  if (cmd == "moves") {
    if (args.size() >= 2 && looks_like_square(args[1])) {
      const Position b = position_from_args(args, 2);
      const Square from = parse_square(args[1]);
      std::cout << args[1] << ":";
      for (Square to : legal_destinations(b, from)) std::cout << ' ' << square_name(to);
      std::cout << "\n";
      return 0;
    }
    const Position b = position_from_args(args, 1);
    MoveList ml;
    generate_legal(b, ml);
    for (const auto& m : ml) std::cout << move_to_uci(m) << "\n";
    std::cout << "total " << ml.size() << "\n";
    return 0;
  }

  // status [fen...]
  if (cmd == "status") {
    const Game g(position_from_args(args, 1));
    std::cout << status_name(g.status()) << " - " << g.status_text() << "\n";
    return 0;
  }

  // play <move> [move...]
  if (cmd == "play") {
    if (args.size() < 2) { usage(); return 1; }
    Game g;
    for (size_t i = 1; i < args.size(); ++i) {
      if (!g.play_uci(args[i])) {
        std::cerr << "illegal move " << args[i] << " in " << to_fen(g.position()) << "\n";
        return 1;
      }
      const Position& p = g.position();
      const bool whiteMoved = p.side_to_move() == Color::Black;
      const int moveNo = whiteMoved ? p.fullmove_number() : p.fullmove_number() - 1;
      std::cout << moveNo << (whiteMoved ? ". " : "... ") << g.history().back().san << "\n";
    }
    std::cout << "fen " << to_fen(g.position()) << "\n";
    std::cout << g.status_text() << "\n";
    return 0;
  }

  // selfplay [games <N>] [plies <N>] [seed <N>] [quiet] [fen <FEN...>]
  if (cmd == "selfplay") {
    SelfPlayConfig cfg{};
    size_t fenStart = args.size();

    for (size_t i = 1; i < args.size(); ++i) {
      const std::string& tok = args[i];

      if (tok == "fen")   { fenStart = i + 1; break; }
      if (tok == "quiet") { cfg.printPerGame = false; continue; }
      if (i + 1 >= args.size()) break;

      const std::string& val = args[i + 1];

      if (tok == "games") { cfg.games = to_int(val); ++i; continue; }
      if (tok == "plies") { cfg.maxPlies = to_int(val); ++i; continue; }
      if (tok == "seed")  { cfg.seed = to_u64(val); ++i; continue; }
    }

    const Position b = position_from_args(args, fenStart);
    const SelfPlaySummary s = selfplay_many(b, cfg);

    std::cout << "games " << s.games
              << " white " << s.whiteWins
              << " black " << s.blackWins
              << " draws " << s.draws
              << " capped " << s.aborted
              << " plies " << s.plies
              << " seconds " << s.seconds << "\n";
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
