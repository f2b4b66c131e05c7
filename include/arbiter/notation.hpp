#pragma once
#include <string>
#include "arbiter/move_apply.hpp"

namespace arbiter {

// Short algebraic rendering of a move that has been applied, e.g. "Nf3",
// "exd6", "e8=Q+", "O-O", "Qh4#". The check suffix is computed on
// applied.position.
//
// Known limitation: no disambiguation when two pieces of the same type
// can reach the destination ("Rae1", "N1f3" are rendered "Re1", "Nf3").
std::string to_san(const AppliedMove& applied);

} // namespace arbiter
