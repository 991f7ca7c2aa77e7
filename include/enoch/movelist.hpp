#pragma once
#include <array>
#include <cstddef>
#include "enoch/move.hpp"


namespace enoch {


// One army's moves. 16 rooks on an open board would need 224 slots.
struct MoveList {
static constexpr std::size_t CAP = 256;
std::array<Move, CAP> data{};
std::size_t sz = 0;


void push(const Move& m) { if (sz < CAP) data[sz++] = m; }
void clear() { sz = 0; }
const Move* begin() const { return data.data(); }
const Move* end() const { return data.data() + sz; }
std::size_t size() const { return sz; }
bool empty() const { return sz == 0; }
const Move& operator[](std::size_t i) const { return data[i]; }
};


} // namespace enoch
