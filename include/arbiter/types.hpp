#pragma once
#include <cstdint>


namespace arbiter {


using Square = int; // 0..63, a1 = 0, h8 = 63
constexpr Square NO_SQUARE = -1;


enum class Color : int { White = 0, Black = 1 };


enum class PieceType : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5, None=6 };


struct Piece {
  PieceType type{PieceType::None};
  Color color{Color::White};

  bool empty() const { return type == PieceType::None; }
  bool operator==(const Piece&) const = default;
};


constexpr int COLOR_N = 2;
constexpr int PIECE_N = 6; // without None


inline constexpr int file_of(Square s) { return s & 7; }
inline constexpr int rank_of(Square s) { return s >> 3; }
inline constexpr Square make_square(int file, int rank) { return rank * 8 + file; }
inline constexpr bool on_board(int file, int rank) { return file >= 0 && file < 8 && rank >= 0 && rank < 8; }
inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }

// rank a pawn of color c starts on, and the rank it promotes on
inline constexpr int pawn_home_rank(Color c) { return c == Color::White ? 1 : 6; }
inline constexpr int last_rank(Color c) { return c == Color::White ? 7 : 0; }
inline constexpr int pawn_dir(Color c) { return c == Color::White ? 1 : -1; }


} // namespace arbiter
