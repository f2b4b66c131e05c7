#include "arbiter/fen.hpp"
#include "arbiter/square.hpp"
#include <charconv>
#include <sstream>
#include <string>

namespace arbiter {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static inline int to_int(const std::string& s, const char* field) {
  int v = 0;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || ptr != last || v < 0)
    throw FormatError(std::string("Invalid ") + field + " in FEN: '" + s + "'");
  return v;
}

static inline Piece char_to_piece(char c) {
  switch (c) {
    case 'P': return Piece{PieceType::Pawn,   Color::White};
    case 'N': return Piece{PieceType::Knight, Color::White};
    case 'B': return Piece{PieceType::Bishop, Color::White};
    case 'R': return Piece{PieceType::Rook,   Color::White};
    case 'Q': return Piece{PieceType::Queen,  Color::White};
    case 'K': return Piece{PieceType::King,   Color::White};
    case 'p': return Piece{PieceType::Pawn,   Color::Black};
    case 'n': return Piece{PieceType::Knight, Color::Black};
    case 'b': return Piece{PieceType::Bishop, Color::Black};
    case 'r': return Piece{PieceType::Rook,   Color::Black};
    case 'q': return Piece{PieceType::Queen,  Color::Black};
    case 'k': return Piece{PieceType::King,   Color::Black};
    default:  return Piece{};
  }
}

char piece_to_char(Piece p) {
  const char* W = "PNBRQK";
  const char* B = "pnbrqk";
  if (p.empty()) return '.';
  int idx = static_cast<int>(p.type);
  return (p.color == Color::White ? W[idx] : B[idx]);
}

Position from_fen(std::string_view fen) {
  Position b;

  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active, castling, ep, half, full, extra;
  if (!(ss >> placement >> active >> castling >> ep >> half >> full))
    throw FormatError("Malformed FEN: expected 6 fields");
  if (ss >> extra)
    throw FormatError("Malformed FEN: unexpected trailing field '" + extra + "'");

  // 1) Piece placement, rank 8 first
  int r = 7, f = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (f != 8) throw FormatError("FEN rank does not have 8 files");
      if (r == 0) throw FormatError("FEN placement has more than 8 ranks");
      --r; f = 0;
      continue;
    }
    if (is_digit(ch)) {
      if (ch < '1' || ch > '8') throw FormatError("Invalid empty-square count in FEN");
      f += ch - '0';
      if (f > 8) throw FormatError("FEN rank has more than 8 files");
      continue;
    }
    Piece p = char_to_piece(ch);
    if (p.empty()) throw FormatError(std::string("Invalid piece character in FEN: '") + ch + "'");
    if (f > 7) throw FormatError("FEN rank has more than 8 files");
    b.set_piece(make_square(f, r), p);
    ++f;
  }
  if (r != 0 || f != 8) throw FormatError("FEN placement must have exactly 8 ranks of 8 files");

  // 2) Active color
  if (active == "w") b.set_side_to_move(Color::White);
  else if (active == "b") b.set_side_to_move(Color::Black);
  else throw FormatError("Invalid active color in FEN");

  // 3) Castling rights
  Castling cr{};
  if (castling != "-") {
    for (char cch : castling) {
      unsigned bit = 0;
      if (cch == 'K') bit = Castling::WhiteKing;
      else if (cch == 'Q') bit = Castling::WhiteQueen;
      else if (cch == 'k') bit = Castling::BlackKing;
      else if (cch == 'q') bit = Castling::BlackQueen;
      else throw FormatError("Invalid castling char in FEN");
      if (cr.rights & bit) throw FormatError("Repeated castling char in FEN");
      cr.rights |= bit;
    }
  }
  b.set_castling(cr);

  // 4) En-passant square
  if (ep == "-") b.set_ep_square(NO_SQUARE);
  else b.set_ep_square(parse_square(ep));

  // 5) Halfmove & 6) Fullmove clocks
  b.set_halfmove_clock(to_int(half, "halfmove clock"));
  const int fm = to_int(full, "fullmove number");
  if (fm < 1) throw FormatError("Invalid fullmove number in FEN: '" + full + "'");
  b.set_fullmove_number(fm);

  return b;
}

std::string to_fen(const Position& b) {
  std::string out;

  // 1) Piece placement
  for (int r = 7; r >= 0; --r) {
    int empties = 0;
    for (int f = 0; f < 8; ++f) {
      Piece p = b.piece_at(make_square(f, r));
      if (p.empty()) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(p);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  out += ' ';

  // 2) Active color
  out += (b.side_to_move() == Color::White ? 'w' : 'b');
  out += ' ';

  // 3) Castling
  const Castling cr = b.castling();
  if (cr.rights == 0) out += '-';
  else {
    if (cr.has(Castling::WhiteKing))  out += 'K';
    if (cr.has(Castling::WhiteQueen)) out += 'Q';
    if (cr.has(Castling::BlackKing))  out += 'k';
    if (cr.has(Castling::BlackQueen)) out += 'q';
  }
  out += ' ';

  // 4) En-passant square
  if (b.ep_square() == NO_SQUARE) out += '-';
  else out += square_name(b.ep_square());
  out += ' ';

  // 5) Halfmove & 6) Fullmove
  out += std::to_string(b.halfmove_clock());
  out += ' ';
  out += std::to_string(b.fullmove_number());

  return out;
}

Position startpos() { return from_fen(STARTPOS_FEN); }

} // namespace arbiter
