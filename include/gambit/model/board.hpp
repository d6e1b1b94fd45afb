#pragma once
#include <array>
#include <cassert>
#include <cstdint>
#include <optional>

#include "core/model_types.hpp"

namespace gambit::model {

class Board {
 public:
  GAMBIT_ALWAYS_INLINE Board() { clear(); }

  GAMBIT_ALWAYS_INLINE void clear() noexcept;

  GAMBIT_ALWAYS_INLINE void setPiece(core::Square sq, bb::Piece p) noexcept;
  GAMBIT_ALWAYS_INLINE void removePiece(core::Square sq) noexcept;
  GAMBIT_ALWAYS_INLINE std::optional<bb::Piece> getPiece(core::Square sq) const noexcept;

  GAMBIT_ALWAYS_INLINE bb::Bitboard getPieces(core::Color c) const noexcept {
    return m_color_occ[bb::ci(c)];
  }
  GAMBIT_ALWAYS_INLINE bb::Bitboard getPieces(core::Color c, core::PieceType t) const noexcept {
    return m_bb[bb::ci(c)][core::idx(t)];
  }
  GAMBIT_ALWAYS_INLINE bb::Bitboard getAllPieces() const noexcept { return m_all_occ; }

 private:
  // [color][type]
  std::array<std::array<bb::Bitboard, core::NUM_PIECE_TYPES>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;

  // Flat by square index: 0 = empty, else (typeIdx+1) | (color<<3)
  std::array<std::uint8_t, 64> m_piece_on{};

  static constexpr std::uint8_t pack_piece(bb::Piece p) noexcept;
  static constexpr bb::Piece unpack_piece(std::uint8_t pp) noexcept;
};

}  // namespace gambit::model

namespace gambit::model {

GAMBIT_ALWAYS_INLINE void Board::clear() noexcept {
  for (auto& byColor : m_bb) byColor.fill(0);
  m_color_occ = {0, 0};
  m_all_occ = 0;
  m_piece_on.fill(0);
}

constexpr std::uint8_t Board::pack_piece(bb::Piece p) noexcept {
  const auto c = static_cast<std::uint8_t>(bb::ci(p.color));
  return static_cast<std::uint8_t>((core::idx(p.type) + 1) | (c << 3));
}

constexpr bb::Piece Board::unpack_piece(std::uint8_t pp) noexcept {
  const auto pt = static_cast<core::PieceType>((pp & 0x7) - 1);
  const core::Color col = ((pp >> 3) & 1u) ? core::Color::Black : core::Color::White;
  return bb::Piece{pt, col};
}

GAMBIT_ALWAYS_INLINE void Board::setPiece(core::Square sq, bb::Piece p) noexcept {
  removePiece(sq);

  const bb::Bitboard mask = bb::sq_bb(sq);
  const int ci = bb::ci(p.color);
  m_bb[ci][core::idx(p.type)] |= mask;
  m_color_occ[ci] |= mask;
  m_all_occ |= mask;
  m_piece_on[sq.index()] = pack_piece(p);
}

GAMBIT_ALWAYS_INLINE void Board::removePiece(core::Square sq) noexcept {
  const std::uint8_t packed = m_piece_on[sq.index()];
  if (!packed) return;

  const bb::Piece old = unpack_piece(packed);
  const bb::Bitboard mask = bb::sq_bb(sq);
  const int ci = bb::ci(old.color);
  assert((m_bb[ci][core::idx(old.type)] & mask) && "square table and bitboards out of sync");

  m_bb[ci][core::idx(old.type)] &= ~mask;
  m_color_occ[ci] &= ~mask;
  m_all_occ &= ~mask;
  m_piece_on[sq.index()] = 0;
}

GAMBIT_ALWAYS_INLINE std::optional<bb::Piece> Board::getPiece(core::Square sq) const noexcept {
  const std::uint8_t packed = m_piece_on[sq.index()];
  if (!packed) return std::nullopt;
  return unpack_piece(packed);
}

}  // namespace gambit::model
