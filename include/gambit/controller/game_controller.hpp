#pragma once

#include <optional>
#include <vector>

// Forward declaration to avoid heavy SFML header
namespace sf {
class Event;
}

#include "../chess_types.hpp"
#include "../model/game_status.hpp"
#include "../model/move.hpp"
#include "../view/game_view.hpp"
#include "selection_manager.hpp"

namespace gambit::model {
class ChessGame;
}

namespace gambit::controller {

// Click flow: pick an own piece, then either pick a highlighted target (the
// move is played and animated), another own piece (reselect) or anything else
// (deselect).
enum class TurnState { SelectPiece, SelectTarget, AnimateMove, GameOver };

class GameController {
 public:
  GameController(view::GameView& gView, model::ChessGame& game);

  void update(float dt);
  void handleEvent(const sf::Event& event);
  void render();

 private:
  void onMouseMove(sf::Vector2i pos);
  void onMousePressed(sf::Vector2i pos);

  void selectPiece(core::Square sq);
  void clearSelection();
  bool isOwnPiece(core::Square sq) const;
  void playMove(const model::Move& m);
  void refreshStatus();

  view::GameView& m_view;
  model::ChessGame& m_game;
  SelectionManager m_selection;

  TurnState m_state = TurnState::SelectPiece;
  std::vector<model::Move> m_selected_moves;
};

}  // namespace gambit::controller
