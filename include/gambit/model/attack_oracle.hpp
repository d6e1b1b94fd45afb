#pragma once
#include "../chess_types.hpp"
#include "board.hpp"
#include "core/bitboard.hpp"

namespace gambit::model {

// Squares `p` standing on `sq` attacks given the occupancy `occ`. Sliders stop
// on (and include) the first occupied square; pawns attack both forward
// diagonals whether anything stands there or not.
[[nodiscard]] GAMBIT_ALWAYS_INLINE bb::Bitboard pieceAttacks(bb::Piece p, core::Square sq,
                                                             bb::Bitboard occ) noexcept {
  switch (p.type) {
    case core::PieceType::Pawn:
      return bb::pawn_attacks(p.color, bb::sq_bb(sq));
    case core::PieceType::Knight:
      return bb::knight_attacks_from(sq);
    case core::PieceType::Bishop:
      return bb::bishop_attacks(sq, occ);
    case core::PieceType::Rook:
      return bb::rook_attacks(sq, occ);
    case core::PieceType::Queen:
      return bb::queen_attacks(sq, occ);
    case core::PieceType::King:
      return bb::king_attacks_from(sq);
  }
  return 0;
}

// Every square attacked by `by`, regardless of whose turn it is.
bb::Bitboard attackedSquares(const Board& b, core::Color by) noexcept;

bool isSquareAttacked(const Board& b, core::Square sq, core::Color by) noexcept;

// True if the king of `side` stands on a square attacked by the other side.
// A board without that king reports false.
bool isKingAttacked(const Board& b, core::Color side) noexcept;

}  // namespace gambit::model
