#include "enoch/notation.hpp"
#include "enoch/move.hpp"

#include <cctype>
#include <stdexcept>

namespace enoch {

static inline char file_char(Square s) { return char('a' + file_of(s)); }
static inline char rank_char(Square s) { return char('1' + rank_of(s)); }

std::string square_name(Square s) {
  if (s < 0 || s > 63) return "-";
  std::string out;
  out.push_back(file_char(s));
  out.push_back(rank_char(s));
  return out;
}

Square parse_square(std::string_view text) {
  if (text.size() != 2) throw std::invalid_argument("bad square length");
  const char f = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
  const char r = text[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8')
    throw std::invalid_argument("bad square");
  return make_square(f - 'a', r - '1');
}

std::string army_token(Army a) {
  std::string s = army_name(a);
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

Army parse_army(std::string_view text) {
  for (Army a : ALL_ARMIES) {
    if (army_token(a) == text) return a;
  }
  throw std::invalid_argument("unknown army");
}

std::string move_to_text(const Move& m) {
  return square_name(m.from) + square_name(m.to);
}

} // namespace enoch
