#include <cassert>
#include "arbiter/fen.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/square.hpp"

using namespace arbiter;

static Square sq(const char* s) { return parse_square(s); }

int main() {
  // single and double push from the home rank
  {
    Position b = from_fen("4k3/8/8/8/8/8/3P4/4K3 w - - 0 1");
    SquareList d = legal_destinations(b, sq("d2"));
    assert(d.size() == 2);
    assert(d.contains(sq("d3")));
    assert(d.contains(sq("d4")));
  }

  // blocked directly in front: no push, no jump
  {
    Position b = from_fen("4k3/8/8/8/8/3b4/3P4/4K3 w - - 0 1");
    assert(legal_destinations(b, sq("d2")).empty());
  }

  // second square blocked: single push only
  {
    Position b = from_fen("4k3/8/8/8/3n4/8/3P4/4K3 w - - 0 1");
    SquareList d = legal_destinations(b, sq("d2"));
    assert(d.size() == 1);
    assert(d.contains(sq("d3")));
  }

  // off the home rank there is no double push
  {
    Position b = from_fen("4k3/8/8/8/8/3P4/8/4K3 w - - 0 1");
    SquareList d = legal_destinations(b, sq("d3"));
    assert(d.size() == 1);
    assert(d.contains(sq("d4")));
  }

  // diagonal captures, blocked push
  {
    Position b = from_fen("4k3/8/8/2nbn3/3P4/8/8/4K3 w - - 0 1");
    SquareList d = legal_destinations(b, sq("d4"));
    assert(d.size() == 2);
    assert(d.contains(sq("c5")));
    assert(d.contains(sq("e5")));
  }

  // own pieces are not captured
  {
    Position b = from_fen("4k3/8/8/2N1N3/3P4/8/8/4K3 w - - 0 1");
    SquareList d = legal_destinations(b, sq("d4"));
    assert(d.size() == 1);
    assert(d.contains(sq("d5")));
  }

  // black pawns move down the board
  {
    Position b = from_fen("4k3/3p4/8/8/8/8/8/4K3 b - - 0 1");
    SquareList d = legal_destinations(b, sq("d7"));
    assert(d.size() == 2);
    assert(d.contains(sq("d6")));
    assert(d.contains(sq("d5")));
  }

  // the side not to move has no destinations
  {
    Position b = from_fen("4k3/3p4/8/8/8/8/3P4/4K3 w - - 0 1");
    assert(legal_destinations(b, sq("d7")).empty());
    assert(legal_destinations(b, sq("e4")).empty());
  }

  // promotion: one destination, four moves
  {
    Position b = from_fen("7k/P7/8/8/8/8/8/K7 w - - 0 1");
    SquareList d = legal_destinations(b, sq("a7"));
    assert(d.size() == 1);
    assert(d.contains(sq("a8")));

    MoveList ml;
    generate_legal(b, ml);
    assert(ml.size() == 7);  // 4 promotions + Ka2, Kb1, Kb2
    assert(ml.contains(Move{sq("a7"), sq("a8"), PieceType::Queen}));
    assert(ml.contains(Move{sq("a7"), sq("a8"), PieceType::Rook}));
    assert(ml.contains(Move{sq("a7"), sq("a8"), PieceType::Bishop}));
    assert(ml.contains(Move{sq("a7"), sq("a8"), PieceType::Knight}));
    assert(!ml.contains(Move{sq("a7"), sq("a8"), PieceType::None}));
  }

  return 0;
}
