#pragma once
#include <cstdint>
#include "enoch/types.hpp"


namespace enoch {


enum class MoveFlag : std::uint8_t {
Quiet = 0,
Capture = 1 << 0,
KingCapture = 1 << 1,   // victim is a King: its army freezes
Promotion = 1 << 2,     // pawn lands in its promotion zone
};

inline constexpr MoveFlag operator|(MoveFlag a, MoveFlag b) {
return static_cast<MoveFlag>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

inline constexpr bool has_flag(MoveFlag set, MoveFlag f) {
return (static_cast<std::uint8_t>(set) & static_cast<std::uint8_t>(f)) != 0;
}


struct Move {
Square from{0};
Square to{0};
PieceKind piece{PieceKind::Pawn};
MoveFlag flags{MoveFlag::Quiet};
};

inline constexpr bool operator==(const Move& a, const Move& b) {
return a.from == b.from && a.to == b.to && a.piece == b.piece && a.flags == b.flags;
}


} // namespace enoch
