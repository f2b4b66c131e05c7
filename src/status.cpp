#include "arbiter/status.hpp"
#include "arbiter/attack.hpp"
#include "arbiter/legal.hpp"

namespace arbiter {

bool has_any_legal_move(const Position& b) {
  const Color us = b.side_to_move();
  for (Square s = 0; s < 64; ++s) {
    const Piece pc = b.piece_at(s);
    if (pc.empty() || pc.color != us) continue;
    if (!legal_destinations(b, s).empty()) return true;
  }
  return false;
}

GameStatus game_status(const Position& b) {
  if (has_any_legal_move(b)) return GameStatus::Ongoing;
  return in_check(b, b.side_to_move()) ? GameStatus::Checkmate : GameStatus::Stalemate;
}

const char* status_name(GameStatus s) {
  switch (s) {
    case GameStatus::Ongoing:   return "ongoing";
    case GameStatus::Checkmate: return "checkmate";
    case GameStatus::Stalemate: return "stalemate";
  }
  return "ongoing";
}

} // namespace arbiter
