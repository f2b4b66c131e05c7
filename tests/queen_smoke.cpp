#include <cassert>
#include "arbiter/fen.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/square.hpp"

int main() {
  using namespace arbiter;

  // Rook + bishop lines from the centre
  Position b1 = from_fen("4k3/8/8/8/3Q4/8/8/4K3 w - - 0 1");
  assert(legal_destinations(b1, parse_square("d4")).size() == 27);

  // Boxed in at the start
  Position b2 = startpos();
  assert(legal_destinations(b2, parse_square("d1")).empty());

  // After 1.e4 e5 the queen sees e2, f3, g4, h5
  Position b3 = from_fen("rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq e6 0 2");
  SquareList d3 = legal_destinations(b3, parse_square("d1"));
  assert(d3.size() == 4);
  assert(d3.contains(parse_square("h5")));

  return 0;
}
