#pragma once
#include <array>
#include <cstddef>
#include <cstdint>


namespace enoch {


using U64 = std::uint64_t;
using Square = int; // 0..63, a1 = 0, h8 = 63

constexpr Square NO_SQUARE = -1;


enum class Army : int { Blue = 0, Black = 1, Red = 2, Yellow = 3 };

// Air = Blue + Black, Earth = Red + Yellow
enum class Team : int { Air = 0, Earth = 1 };

enum class PieceKind : int { King = 0, Queen = 1, Bishop = 2, Knight = 3, Rook = 4, Pawn = 5 };

// Which seat currently commands an army (changes on throne seizure)
enum class Controller : int { PlayerOne = 0, PlayerTwo = 1 };


constexpr int ARMY_N = 4;
constexpr int TEAM_N = 2;
constexpr int KIND_N = 6;

inline constexpr std::array<Army, ARMY_N> ALL_ARMIES = {
  Army::Blue, Army::Black, Army::Red, Army::Yellow
};

inline constexpr std::array<PieceKind, KIND_N> ALL_KINDS = {
  PieceKind::King, PieceKind::Queen, PieceKind::Bishop,
  PieceKind::Knight, PieceKind::Rook, PieceKind::Pawn
};


inline constexpr int file_of(Square s) { return s & 7; }
inline constexpr int rank_of(Square s) { return s >> 3; }
inline constexpr Square make_square(int file, int rank) { return rank * 8 + file; }
inline constexpr U64 bit(Square s) { return 1ULL << s; }

inline constexpr std::size_t idx(Army a) { return static_cast<std::size_t>(a); }
inline constexpr std::size_t idx(Team t) { return static_cast<std::size_t>(t); }
inline constexpr std::size_t idx(PieceKind k) { return static_cast<std::size_t>(k); }

inline constexpr Team team_of(Army a) {
  return (a == Army::Blue || a == Army::Black) ? Team::Air : Team::Earth;
}

inline constexpr Team opponent(Team t) {
  return t == Team::Air ? Team::Earth : Team::Air;
}

inline constexpr Army ally_of(Army a) {
  switch (a) {
    case Army::Blue:   return Army::Black;
    case Army::Black:  return Army::Blue;
    case Army::Red:    return Army::Yellow;
    case Army::Yellow: return Army::Red;
  }
  return a;
}

inline constexpr std::array<Army, 2> team_armies(Team t) {
  return t == Team::Air ? std::array<Army, 2>{Army::Blue, Army::Black}
                        : std::array<Army, 2>{Army::Red, Army::Yellow};
}


// Edge masks
constexpr U64 RANK_1 = 0x00000000000000FFULL;
constexpr U64 RANK_8 = 0xFF00000000000000ULL;
constexpr U64 FILE_A = 0x0101010101010101ULL;
constexpr U64 FILE_H = 0x8080808080808080ULL;

// Promotion edge per army, indexed by Army: Blue marches north, Black east,
// Red south, Yellow west.
inline constexpr std::array<U64, ARMY_N> DEFAULT_PROMOTION_ZONES = {
  RANK_8, FILE_H, RANK_1, FILE_A
};


// The two diagonal systems. A Queen and a Bishop may only capture each
// other when they stand on the same system.
enum class DiagonalSystem : int { Aries = 0, Cancer = 1 };

constexpr U64 ARIES_DIAGONALS  = 0x55AA55AA55AA55AAULL;
constexpr U64 CANCER_DIAGONALS = 0xAA55AA55AA55AA55ULL;

inline constexpr DiagonalSystem diagonal_system(Square s) {
  return ((ARIES_DIAGONALS >> s) & 1ULL) ? DiagonalSystem::Aries : DiagonalSystem::Cancer;
}


inline constexpr const char* army_name(Army a) {
  switch (a) {
    case Army::Blue:   return "Blue";
    case Army::Black:  return "Black";
    case Army::Red:    return "Red";
    case Army::Yellow: return "Yellow";
  }
  return "?";
}

inline constexpr const char* team_name(Team t) {
  return t == Team::Air ? "Air" : "Earth";
}

inline constexpr const char* kind_name(PieceKind k) {
  switch (k) {
    case PieceKind::King:   return "King";
    case PieceKind::Queen:  return "Queen";
    case PieceKind::Bishop: return "Bishop";
    case PieceKind::Knight: return "Knight";
    case PieceKind::Rook:   return "Rook";
    case PieceKind::Pawn:   return "Pawn";
  }
  return "?";
}


} // namespace enoch
