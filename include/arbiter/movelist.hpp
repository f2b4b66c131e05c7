#pragma once
#include <array>
#include <cstddef>
#include "arbiter/move.hpp"


namespace arbiter {


template <typename T, std::size_t N>
struct FixedList {
static constexpr std::size_t CAP = N;
std::array<T, CAP> data{};
std::size_t sz = 0;


void push(const T& v) { if (sz < CAP) data[sz++] = v; }
void clear() { sz = 0; }
const T* begin() const { return data.data(); }
const T* end() const { return data.data() + sz; }
const T& operator[](std::size_t i) const { return data[i]; }
std::size_t size() const { return sz; }
bool empty() const { return sz == 0; }
bool contains(const T& v) const {
  for (const auto& x : *this) if (x == v) return true;
  return false;
}
};


// destinations of a single piece: a queen reaches at most 27 squares
using SquareList = FixedList<Square, 32>;
using MoveList = FixedList<Move, 256>;


} // namespace arbiter
