#pragma once
#include <stdexcept>

namespace arbiter {

// Malformed FEN, square, coordinate or move text.
struct FormatError : std::runtime_error { using std::runtime_error::runtime_error; };

// Engine called in a state it cannot act on (e.g. moving from an empty square).
struct IllegalStateError : std::logic_error { using std::logic_error::logic_error; };

} // namespace arbiter
