#pragma once
#include <cstdint>

#include "../../chess_types.hpp"

#if defined(_MSC_VER)
#define GAMBIT_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define GAMBIT_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define GAMBIT_ALWAYS_INLINE inline
#endif

namespace gambit::model::bb {

// Set of squares, bit i = square with index i (a1 = 0, h8 = 63).
using Bitboard = std::uint64_t;

struct Piece {
  core::PieceType type = core::PieceType::Pawn;
  core::Color color = core::Color::White;

  friend constexpr bool operator==(const Piece&, const Piece&) = default;
};

[[nodiscard]] GAMBIT_ALWAYS_INLINE constexpr int ci(core::Color c) noexcept {
  return c == core::Color::White ? 0 : 1;
}

[[nodiscard]] GAMBIT_ALWAYS_INLINE constexpr Bitboard sq_bb(core::Square s) noexcept {
  return Bitboard{1} << static_cast<unsigned>(s.index());
}

[[nodiscard]] GAMBIT_ALWAYS_INLINE constexpr bool contains(Bitboard set, core::Square s) noexcept {
  return (set & sq_bb(s)) != 0;
}

constexpr Bitboard FILE_A = 0x0101010101010101ULL;
constexpr Bitboard FILE_B = 0x0202020202020202ULL;
constexpr Bitboard FILE_G = 0x4040404040404040ULL;
constexpr Bitboard FILE_H = 0x8080808080808080ULL;

}  // namespace gambit::model::bb
