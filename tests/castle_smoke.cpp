#include <cassert>
#include "arbiter/fen.hpp"
#include "arbiter/legal.hpp"
#include "arbiter/move_apply.hpp"
#include "arbiter/square.hpp"

using namespace arbiter;

static Square sq(const char* s) { return parse_square(s); }

static SquareList king_dests(const char* fen, const char* king) {
  return legal_destinations(from_fen(fen), sq(king));
}

int main() {
  // both sides open: five steps plus two castles
  {
    SquareList d = king_dests("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", "e1");
    assert(d.size() == 7);
    assert(d.contains(sq("g1")));
    assert(d.contains(sq("c1")));

    SquareList e = king_dests("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 0 1", "e8");
    assert(e.contains(sq("g8")));
    assert(e.contains(sq("c8")));
  }

  // f1 attacked: no O-O
  {
    SquareList d = king_dests("r3k2r/8/b7/8/8/8/8/R3K2R w KQkq - 0 1", "e1");
    assert(!d.contains(sq("g1")));
    assert(d.contains(sq("c1")));
  }

  // g1 attacked: no O-O
  {
    SquareList d = king_dests("r3k2r/8/8/8/8/7n/8/R3K2R w KQkq - 0 1", "e1");
    assert(!d.contains(sq("g1")));
    assert(d.contains(sq("c1")));
  }

  // b1 attacked: O-O-O is still allowed
  {
    SquareList d = king_dests("r3k2r/8/8/8/8/n7/8/R3K2R w KQkq - 0 1", "e1");
    assert(d.contains(sq("c1")));
    assert(d.contains(sq("g1")));
  }

  // b1 occupied: no O-O-O
  {
    SquareList d = king_dests("r3k2r/8/8/8/8/8/8/RN2K2R w KQkq - 0 1", "e1");
    assert(!d.contains(sq("c1")));
    assert(d.contains(sq("g1")));
  }

  // in check: no castling at all
  {
    SquareList d = king_dests("r3k2r/8/8/8/8/8/4r3/R3K2R w KQkq - 0 1", "e1");
    assert(!d.contains(sq("g1")));
    assert(!d.contains(sq("c1")));
  }

  // rights gone
  {
    SquareList d = king_dests("r3k2r/8/8/8/8/8/8/R3K2R w kq - 0 1", "e1");
    assert(d.size() == 5);
  }

  // right claimed but the rook is missing
  {
    SquareList d = king_dests("r3k2r/8/8/8/8/8/8/4K2R w KQkq - 0 1", "e1");
    assert(d.contains(sq("g1")));
    assert(!d.contains(sq("c1")));
  }

  // applying castles moves the rook and drops both rights of the mover
  {
    Position b = from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    AppliedMove a = apply_move(b, Move{sq("e1"), sq("g1")});
    assert(a.is_castle_kingside());
    assert(!a.is_capture());
    const Position& n = a.position;
    assert(n.piece_at(sq("g1")) == (Piece{PieceType::King, Color::White}));
    assert(n.piece_at(sq("f1")) == (Piece{PieceType::Rook, Color::White}));
    assert(n.piece_at(sq("h1")).empty());
    assert(n.piece_at(sq("e1")).empty());
    assert(n.castling().rights == (Castling::BlackKing | Castling::BlackQueen));
    assert(to_fen(n) == "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");

    AppliedMove c = apply_move(n, Move{sq("e8"), sq("c8")});
    assert(c.is_castle_queenside());
    assert(c.position.piece_at(sq("d8")) == (Piece{PieceType::Rook, Color::Black}));
    assert(c.position.piece_at(sq("a8")).empty());
    assert(to_fen(c.position) == "2kr3r/8/8/8/8/8/8/R4RK1 w - - 2 2");
  }

  return 0;
}
