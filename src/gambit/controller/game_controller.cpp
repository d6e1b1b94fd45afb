#include "gambit/controller/game_controller.hpp"

#include <SFML/Window/Event.hpp>
#include <SFML/Window/Mouse.hpp>
#include <iostream>
#include <variant>

#include "gambit/model/chess_game.hpp"

namespace gambit::controller {

GameController::GameController(view::GameView& gView, model::ChessGame& game)
    : m_view(gView), m_game(game), m_selection(gView) {
  m_selection.reset();
  refreshStatus();
}

void GameController::update(float dt) {
  m_view.update(dt);
}

void GameController::render() {
  m_view.render(m_game.currentPosition());
}

void GameController::handleEvent(const sf::Event& event) {
  switch (event.type) {
    case sf::Event::MouseMoved:
      onMouseMove({event.mouseMove.x, event.mouseMove.y});
      break;
    case sf::Event::MouseButtonPressed:
      if (event.mouseButton.button == sf::Mouse::Left)
        onMousePressed({event.mouseButton.x, event.mouseButton.y});
      break;
    case sf::Event::MouseLeft:
    case sf::Event::LostFocus:
      m_selection.dehoverSquare();
      break;
    default:
      break;
  }
}

void GameController::onMouseMove(sf::Vector2i pos) {
  const auto sq = m_view.mousePosToSquare(pos);
  m_selection.dehoverSquare();
  if (sq && m_state != TurnState::GameOver) m_selection.hoverSquare(*sq);
}

void GameController::onMousePressed(sf::Vector2i pos) {
  const auto sq = m_view.mousePosToSquare(pos);

  switch (m_state) {
    case TurnState::SelectPiece:
      if (sq && isOwnPiece(*sq)) selectPiece(*sq);
      break;

    case TurnState::SelectTarget: {
      if (!sq) {
        clearSelection();
        break;
      }
      if (isOwnPiece(*sq)) {
        selectPiece(*sq);
        break;
      }
      for (const auto& m : m_selected_moves) {
        if (m.to == *sq) {
          playMove(m);
          return;
        }
      }
      clearSelection();
      break;
    }

    // input is ignored while a piece is in flight and after the game ended
    case TurnState::AnimateMove:
    case TurnState::GameOver:
      break;
  }
}

bool GameController::isOwnPiece(core::Square sq) const {
  const auto& pos = m_game.currentPosition();
  const auto piece = pos.pieceAt(sq);
  return piece && piece->color == pos.sideToMove();
}

void GameController::selectPiece(core::Square sq) {
  m_selection.selectSquare(sq);
  m_selected_moves = m_game.legalMovesFrom(sq);
  for (const auto& m : m_selected_moves) m_view.highlightLegalTarget(m.to, m.isCapture());
  m_state = TurnState::SelectTarget;
}

void GameController::clearSelection() {
  m_selection.deselectSquare();
  m_selected_moves.clear();
  m_state = TurnState::SelectPiece;
}

void GameController::playMove(const model::Move& m) {
  const model::MoveResult res = m_game.applyMove(m);
  if (const auto* err = std::get_if<model::MoveError>(&res)) {
    std::cerr << "[GameController] rejected " << model::toString(m) << ": "
              << model::toString(*err) << "\n";
    clearSelection();
    return;
  }

  m_selection.deselectSquare();
  m_selected_moves.clear();
  m_selection.setLastMove(m.from, m.to);
  m_view.clearCheck();
  m_state = TurnState::AnimateMove;

  m_view.animateMove(m, [this]() { refreshStatus(); });
}

void GameController::refreshStatus() {
  const model::GameStatus status = m_game.status();
  const auto& pos = m_game.currentPosition();

  m_view.setStatus(status, pos.sideToMove());

  if (status.kind == model::GameStatus::Kind::Check ||
      status.kind == model::GameStatus::Kind::Checkmate) {
    if (const auto ksq = pos.kingSquare(status.color)) m_view.highlightCheckSquare(*ksq);
  }

  if (status.isTerminal()) {
    m_selection.dehoverSquare();
    m_state = TurnState::GameOver;
  } else {
    m_state = TurnState::SelectPiece;
  }
}

}  // namespace gambit::controller
