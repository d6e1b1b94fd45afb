#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace gambit::model {

struct Placement {
  core::Square square;
  bb::Piece piece;
};

class Position {
 public:
  // Standard initial arrangement, White to move.
  Position();

  // Explicit arrangement. Throws std::invalid_argument on a repeated square or
  // when either side does not have exactly one king.
  Position(std::initializer_list<Placement> pieces, core::Color sideToMove);

  const Board& getBoard() const { return m_board; }
  const GameState& getState() const { return m_state; }

  [[nodiscard]] core::Color sideToMove() const noexcept { return m_state.sideToMove; }
  [[nodiscard]] const std::optional<LastMove>& lastMove() const noexcept {
    return m_state.lastMove;
  }
  [[nodiscard]] bool lastMoveWasDoublePush() const noexcept {
    return m_state.lastMove && m_state.lastMove->doublePush;
  }

  [[nodiscard]] std::optional<bb::Piece> pieceAt(core::Square sq) const noexcept {
    return m_board.getPiece(sq);
  }

  [[nodiscard]] std::optional<core::Square> kingSquare(core::Color c) const noexcept;
  [[nodiscard]] int kingCount(core::Color c) const noexcept {
    return bb::popcount(m_board.getPieces(c, core::PieceType::King));
  }
  [[nodiscard]] bool kingsIntact() const noexcept {
    return kingCount(core::Color::White) == 1 && kingCount(core::Color::Black) == 1;
  }

  // Applies m without any legality check: vacates the source, puts the mover
  // on the target (replacing any occupant), flips the side to move and
  // records the last move. Legality is ChessGame's job.
  void doMove(const Move& m);

  // Eight ranks from rank 8 down, '.' for empty, upper case for White.
  std::string toAscii() const;

 private:
  Board m_board;
  GameState m_state;

  void place(const std::vector<Placement>& pieces, core::Color sideToMove);
};

}  // namespace gambit::model
