#pragma once

#include <vector>

#include "gambit/model/move.hpp"
#include "gambit/model/position.hpp"

namespace gambit::model {

class MoveGenerator {
 public:
  // Pseudo-legal moves of the side to move: movement geometry, blocking and
  // capture rules only. Whether the mover's king ends up attacked is not
  // considered. Moves are appended to `out`.
  void generatePseudoLegalMoves(const Position& pos, std::vector<Move>& out) const;

  // Same, restricted to the piece on `from`. Appends nothing if `from` is
  // empty or holds a piece of the side not to move.
  void generatePseudoLegalMovesFrom(const Position& pos, core::Square from,
                                    std::vector<Move>& out) const;

 private:
  void genPieceMoves(const Board& b, core::Square from, bb::Piece p,
                     std::vector<Move>& out) const;
  void genPawnMoves(const Board& b, core::Square from, bb::Piece p, std::vector<Move>& out) const;
};

}  // namespace gambit::model
