#include "gambit/model/attack_oracle.hpp"

namespace gambit::model {

bb::Bitboard attackedSquares(const Board& b, core::Color by) noexcept {
  const bb::Bitboard occ = b.getAllPieces();
  bb::Bitboard atk = bb::pawn_attacks(by, b.getPieces(by, core::PieceType::Pawn));

  for (bb::Bitboard pieces = b.getPieces(by) & ~b.getPieces(by, core::PieceType::Pawn); pieces;) {
    const core::Square s = bb::pop_lsb(pieces);
    // getPiece cannot be empty here: s came out of by's occupancy.
    atk |= pieceAttacks(*b.getPiece(s), s, occ);
  }
  return atk;
}

bool isSquareAttacked(const Board& b, core::Square sq, core::Color by) noexcept {
  const bb::Bitboard target = bb::sq_bb(sq);
  const bb::Bitboard occ = b.getAllPieces();

  // Pawns: squares from which a pawn of 'by' hits 'sq'
  const bb::Bitboard pawnFrom = bb::pawn_attacks(~by, target);
  if (pawnFrom & b.getPieces(by, core::PieceType::Pawn)) return true;

  if (bb::knight_attacks_from(sq) & b.getPieces(by, core::PieceType::Knight)) return true;
  if (bb::king_attacks_from(sq) & b.getPieces(by, core::PieceType::King)) return true;

  const bb::Bitboard q = b.getPieces(by, core::PieceType::Queen);
  const bb::Bitboard bq = b.getPieces(by, core::PieceType::Bishop) | q;
  if (bq && (bb::bishop_attacks(sq, occ) & bq)) return true;

  const bb::Bitboard rq = b.getPieces(by, core::PieceType::Rook) | q;
  if (rq && (bb::rook_attacks(sq, occ) & rq)) return true;

  return false;
}

bool isKingAttacked(const Board& b, core::Color side) noexcept {
  const bb::Bitboard kbb = b.getPieces(side, core::PieceType::King);
  if (!kbb) return false;
  return isSquareAttacked(b, core::Square::fromIndex(bb::ctz64(kbb)), ~side);
}

}  // namespace gambit::model
