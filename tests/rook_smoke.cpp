#include <cassert>
#include "arbiter/fen.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/square.hpp"

int main() {
  using namespace arbiter;

  // Open board: rank and file
  Position b1 = from_fen("4k3/8/8/8/3R4/8/8/4K3 w - - 0 1");
  SquareList d1 = legal_destinations(b1, parse_square("d4"));
  assert(d1.size() == 14);
  assert(d1.contains(parse_square("d8")));
  assert(d1.contains(parse_square("a4")));
  assert(d1.contains(parse_square("h4")));
  assert(d1.contains(parse_square("d1")));

  // Own pawn on d6 blocks the way up
  Position b2 = from_fen("4k3/8/3P4/8/3R4/8/8/4K3 w - - 0 1");
  SquareList d2 = legal_destinations(b2, parse_square("d4"));
  assert(d2.size() == 11);
  assert(d2.contains(parse_square("d5")));
  assert(!d2.contains(parse_square("d6")));

  // Corner rook hemmed in by its own pieces
  Position b3 = startpos();
  assert(legal_destinations(b3, parse_square("a1")).empty());

  return 0;
}
