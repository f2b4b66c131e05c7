#pragma once
#include <array>
#include "arbiter/types.hpp"


namespace arbiter {


struct Castling { // bit 0..3 = KQkq
static constexpr unsigned WhiteKing  = 0x1;
static constexpr unsigned WhiteQueen = 0x2;
static constexpr unsigned BlackKing  = 0x4;
static constexpr unsigned BlackQueen = 0x8;

unsigned rights = 0;

bool has(unsigned flag) const { return (rights & flag) != 0; }
bool operator==(const Castling&) const = default;
};


// Mailbox position: one Piece per square plus the FEN state fields.
// Engine transitions copy a Position and edit the copy; the setters below
// exist for that and for the FEN decoder.
class Position {
public:
Position();
void clear();


Piece piece_at(Square s) const { return squares_[static_cast<std::size_t>(s)]; }
void set_piece(Square s, Piece p) { squares_[static_cast<std::size_t>(s)] = p; }
void remove_piece(Square s) { squares_[static_cast<std::size_t>(s)] = Piece{}; }


void set_side_to_move(Color c) { stm_ = c; }
Color side_to_move() const { return stm_; }


void set_castling(Castling c) { castling_ = c; }
Castling castling() const { return castling_; }


void set_ep_square(Square s) { ep_square_ = s; }
Square ep_square() const { return ep_square_; }


void set_halfmove_clock(int n) { halfmove_ = n; }
int halfmove_clock() const { return halfmove_; }


void set_fullmove_number(int n) { fullmove_ = n; }
int fullmove_number() const { return fullmove_; }


// NO_SQUARE if the side has no king on the board
Square king_square(Color c) const;


bool operator==(const Position&) const = default;


private:
std::array<Piece, 64> squares_{};
Color stm_ = Color::White;
Castling castling_{};
Square ep_square_ = NO_SQUARE;
int halfmove_ = 0;
int fullmove_ = 1;
};


} // namespace arbiter
