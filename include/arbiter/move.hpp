#pragma once
#include <cstdint>
#include "arbiter/types.hpp"


namespace arbiter {


// What happened when a move was applied; set by apply_move().
enum class MoveFlag : std::uint8_t {
Quiet = 0,
Capture = 1 << 0,
DoublePush = 1 << 1,
EnPassant = 1 << 2,
CastleKing = 1 << 3,
CastleQueen = 1 << 4,
Promotion = 1 << 5,
};


inline constexpr MoveFlag operator|(MoveFlag a, MoveFlag b) {
  return static_cast<MoveFlag>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}
inline constexpr MoveFlag& operator|=(MoveFlag& a, MoveFlag b) { a = a | b; return a; }
inline constexpr bool has_flag(MoveFlag set, MoveFlag f) {
  return (static_cast<std::uint8_t>(set) & static_cast<std::uint8_t>(f)) != 0;
}


struct Move {
Square from{0};
Square to{0};
PieceType promo{PieceType::None};

bool operator==(const Move&) const = default;
};


} // namespace arbiter
