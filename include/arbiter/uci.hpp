// include/arbiter/uci.hpp
#pragma once
#include <string>
#include <string_view>

#include "arbiter/move.hpp"

namespace arbiter {

// Convert a Move to coordinate notation like "e2e4" or "a7a8q"
std::string move_to_uci(const Move& m);

// Parse "<from><to>[q|r|b|n]". Syntax only: legality is the caller's job.
// Throws FormatError on anything else.
Move uci_to_move(std::string_view uci);

} // namespace arbiter
