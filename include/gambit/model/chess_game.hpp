#pragma once

#include <vector>

#include "game_status.hpp"
#include "legality.hpp"
#include "position.hpp"

namespace gambit::model {

// Owns the position of one game and the status derived from it. applyMove is
// the only mutator; every other member is a read-only query. Not thread-safe:
// callers serialize moves, concurrent readers work on a copied Position.
class ChessGame {
 public:
  ChessGame();
  explicit ChessGame(Position start);

  // Rejects with GameOver once the game has ended and with IllegalMove unless
  // `candidate` matches a current legal move on from, to, piece and capture
  // (the double-push flag is ignored). The generated move is what gets played
  // and recorded. On success returns the freshly computed status for the new
  // side to move.
  MoveResult applyMove(const Move& candidate);
  // Input-layer convenience: plays the legal move from -> to, if any.
  MoveResult applyMove(core::Square from, core::Square to);

  const Position& currentPosition() const { return m_position; }
  GameStatus status() const { return m_status; }

  std::vector<Move> legalMoves() const;
  std::vector<Move> legalMovesFrom(core::Square from) const;

  const std::vector<Move>& moveHistory() const { return m_history; }

 private:
  Position m_position;
  GameStatus m_status;
  std::vector<Move> m_history;
};

}  // namespace gambit::model
