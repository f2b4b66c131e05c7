#pragma once
#include "arbiter/position.hpp"

namespace arbiter {

enum class GameStatus { Ongoing, Checkmate, Stalemate };

// Classifies the position for the side to move. Never throws.
GameStatus game_status(const Position& b);

bool has_any_legal_move(const Position& b);

const char* status_name(GameStatus s);

} // namespace arbiter
