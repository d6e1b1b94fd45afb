#include "gambit/model/chess_game.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

namespace gambit::model {

namespace {

// Same action on the board. The double-push flag follows from the geometry and
// is taken from the generated move, not from the caller.
bool sameAction(const Move& a, const Move& b) {
  return a.from == b.from && a.to == b.to && a.piece == b.piece && a.captured == b.captured;
}

}  // namespace

// ---------------- Public API ----------------

ChessGame::ChessGame() : m_status(GameStatus::inProgress()) {
  m_history.reserve(128);
}

ChessGame::ChessGame(Position start)
    : m_position(std::move(start)), m_status(computeStatus(m_position)) {
  m_history.reserve(128);
}

MoveResult ChessGame::applyMove(const Move& candidate) {
  if (m_status.isTerminal()) return MoveError::GameOver;

  const auto legal = legalMoves();
  const auto it = std::find_if(legal.begin(), legal.end(),
                               [&](const Move& m) { return sameAction(m, candidate); });
  if (it == legal.end()) return MoveError::IllegalMove;

  const Move played = *it;
  m_position.doMove(played);
  m_history.push_back(played);
  assert(m_position.kingsIntact() && "move application lost or duplicated a king");

  m_status = computeStatus(m_position);
  return m_status;
}

MoveResult ChessGame::applyMove(core::Square from, core::Square to) {
  if (m_status.isTerminal()) return MoveError::GameOver;

  for (const auto& m : legalMovesFrom(from)) {
    if (m.to == to) return applyMove(m);
  }
  return MoveError::IllegalMove;
}

std::vector<Move> ChessGame::legalMoves() const {
  std::vector<Move> out;
  out.reserve(64);
  generateLegalMoves(m_position, out);
  return out;
}

std::vector<Move> ChessGame::legalMovesFrom(core::Square from) const {
  return model::legalMovesFrom(m_position, from);
}

}  // namespace gambit::model
