#include "arbiter/uci.hpp"
#include "arbiter/errors.hpp"
#include "arbiter/square.hpp"

#include <cctype>
#include <string>

namespace arbiter {

// ------------ helpers ------------
static inline PieceType promo_from_char(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'q': return PieceType::Queen;
    case 'r': return PieceType::Rook;
    case 'b': return PieceType::Bishop;
    case 'n': return PieceType::Knight;
    default:  return PieceType::None;
  }
}

static inline char promo_to_char(PieceType p) {
  switch (p) {
    case PieceType::Queen:  return 'q';
    case PieceType::Rook:   return 'r';
    case PieceType::Bishop: return 'b';
    case PieceType::Knight: return 'n';
    default:                return '\0';
  }
}

// ------------ coordinate move conversion ------------
std::string move_to_uci(const Move& m) {
  std::string s;
  s.reserve(5);
  s += square_name(m.from);
  s += square_name(m.to);
  char pc = promo_to_char(m.promo);
  if (pc) s.push_back(pc);
  return s;
}

Move uci_to_move(std::string_view uci) {
  if (uci.size() != 4 && uci.size() != 5)
    throw FormatError("Bad coordinate move length: '" + std::string(uci) + "'");

  Move m;
  m.from = parse_square(uci.substr(0, 2));
  m.to   = parse_square(uci.substr(2, 2));
  if (uci.size() == 5) {
    m.promo = promo_from_char(uci[4]);
    if (m.promo == PieceType::None)
      throw FormatError("Bad promotion letter in move: '" + std::string(uci) + "'");
  }
  return m;
}

} // namespace arbiter
