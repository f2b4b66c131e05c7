#include <cassert>
#include <string>
#include "arbiter/position.hpp"
#include "arbiter/fen.hpp"
#include "arbiter/square.hpp"


int main() {
using namespace arbiter;


// Round-trip startpos
Position b1 = from_fen(STARTPOS_FEN);
assert(to_fen(b1) == STARTPOS_FEN);
assert(b1 == startpos());
assert(b1.piece_at(parse_square("e1")) == (Piece{PieceType::King, Color::White}));
assert(b1.piece_at(parse_square("d8")) == (Piece{PieceType::Queen, Color::Black}));
assert(b1.piece_at(parse_square("e4")).empty());
assert(b1.side_to_move() == Color::White);
assert(b1.castling().rights == 0xFu);
assert(b1.ep_square() == NO_SQUARE);
assert(b1.halfmove_clock() == 0);
assert(b1.fullmove_number() == 1);


// A position with castling rights only on white
Position b2 = from_fen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w K - 0 1");
assert(to_fen(b2) == "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w K - 0 1");


// En-passant square, clocks and black to move survive the trip
const char* fen3 = "rnbqkbnr/ppp1pppp/8/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3";
Position b3 = from_fen(fen3);
assert(b3.ep_square() == parse_square("d6"));
assert(b3.fullmove_number() == 3);
assert(to_fen(b3) == fen3);

const char* fen4 = "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R b Qk - 17 42";
Position b4 = from_fen(fen4);
assert(b4.side_to_move() == Color::Black);
assert(b4.halfmove_clock() == 17);
assert(b4.castling().rights == (Castling::WhiteQueen | Castling::BlackKing));
assert(to_fen(b4) == fen4);
assert(from_fen(to_fen(b4)) == b4);


// Castling letters in any order decode to the same rights
assert(from_fen("4k3/8/8/8/8/8/8/4K3 w qkQK - 0 1").castling().rights == 0xFu);
assert(to_fen(from_fen("r3k2r/8/8/8/8/8/8/R3K2R w qkQK - 0 1")) ==
       "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");


// Extra whitespace between fields is accepted
assert(from_fen("  4k3/8/8/8/8/8/8/4K3   w  -  -  0  1 ") ==
       from_fen("4k3/8/8/8/8/8/8/4K3 w - - 0 1"));


return 0;
}
