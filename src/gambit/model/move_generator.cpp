#include "gambit/model/move_generator.hpp"

#include "gambit/model/attack_oracle.hpp"

namespace gambit::model {

namespace {

using core::Color;
using core::Square;
using PT = core::PieceType;

inline void emit(const Board& b, Square from, Square to, bb::Piece p, std::vector<Move>& out,
                 bool doublePush = false) {
  out.push_back(Move{from, to, p, b.getPiece(to), doublePush});
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Position& pos, std::vector<Move>& out) const {
  const Board& b = pos.getBoard();
  const Color us = pos.sideToMove();

  for (bb::Bitboard pieces = b.getPieces(us); pieces;) {
    const Square from = bb::pop_lsb(pieces);
    genPieceMoves(b, from, *b.getPiece(from), out);
  }
}

void MoveGenerator::generatePseudoLegalMovesFrom(const Position& pos, core::Square from,
                                                 std::vector<Move>& out) const {
  const Board& b = pos.getBoard();
  const auto piece = b.getPiece(from);
  if (!piece || piece->color != pos.sideToMove()) return;
  genPieceMoves(b, from, *piece, out);
}

void MoveGenerator::genPieceMoves(const Board& b, core::Square from, bb::Piece p,
                                  std::vector<Move>& out) const {
  if (p.type == PT::Pawn) {
    genPawnMoves(b, from, p, out);
    return;
  }

  // Knight, king and sliders all move onto exactly the squares they attack,
  // minus those held by their own side.
  bb::Bitboard targets = pieceAttacks(p, from, b.getAllPieces()) & ~b.getPieces(p.color);
  while (targets) emit(b, from, bb::pop_lsb(targets), p, out);
}

void MoveGenerator::genPawnMoves(const Board& b, core::Square from, bb::Piece p,
                                 std::vector<Move>& out) const {
  const bool white = (p.color == Color::White);
  const int dir = white ? 1 : -1;
  const int startRank = white ? 1 : 6;

  if (const auto one = from.offset(0, dir); one && !b.getPiece(*one)) {
    emit(b, from, *one, p, out);
    if (from.rank() == startRank) {
      const auto two = one->offset(0, dir);
      if (two && !b.getPiece(*two)) emit(b, from, *two, p, out, true);
    }
  }

  // Diagonals only onto an opposing piece
  bb::Bitboard caps = bb::pawn_attacks(p.color, bb::sq_bb(from)) & b.getPieces(~p.color);
  while (caps) emit(b, from, bb::pop_lsb(caps), p, out);
}

}  // namespace gambit::model
