// include/enoch/notation.hpp
#pragma once
#include <string>
#include <string_view>
#include "enoch/types.hpp"

namespace enoch {

struct Move;

// "e4" <-> 28. parse_square throws std::invalid_argument on bad input.
std::string square_name(Square s);
Square parse_square(std::string_view text);

// Lower-case army names ("blue", "black", ...). Throws std::invalid_argument.
std::string army_token(Army a);
Army parse_army(std::string_view text);

// Coordinate form, e.g. "e2e3"
std::string move_to_text(const Move& m);

} // namespace enoch
