#pragma once

#include <SFML/Graphics/Font.hpp>
#include <SFML/System/Vector2.hpp>
#include <functional>
#include <memory>
#include <optional>

#include "gambit/app/app_config.hpp"
#include "gambit/model/game_status.hpp"
#include "gambit/model/move.hpp"
#include "gambit/model/position.hpp"
#include "gambit/view/animation/move_animation.hpp"
#include "gambit/view/board_view.hpp"
#include "gambit/view/highlight_manager.hpp"
#include "gambit/view/piece_manager.hpp"
#include "gambit/view/status_view.hpp"

namespace sf
{
  class RenderWindow;
}

namespace gambit::view
{

  class GameView
  {
  public:
    GameView(sf::RenderWindow &window, const app::AppConfig &cfg);

    // Window size needed for board plus status banner.
    static sf::Vector2u requiredWindowSize(const app::AppConfig &cfg);

    void update(float dt);
    void render(const model::Position &pos);

    [[nodiscard]] std::optional<core::Square> mousePosToSquare(sf::Vector2i mousePos) const;

    void setStatus(const model::GameStatus &status, core::Color sideToMove);

    // Slides the mover of `m` from source to target; the piece on `m.to` is
    // hidden while it is in flight. Without animation onComplete fires at once.
    void animateMove(const model::Move &m, std::function<void()> onComplete);

    void highlightSelectSquare(core::Square sq);
    void highlightHoverSquare(core::Square sq);
    void highlightLegalTarget(core::Square sq, bool capture);
    void highlightLastMove(core::Square from, core::Square to);
    void highlightCheckSquare(core::Square sq);
    void clearSelection();
    void clearHover();
    void clearCheck();

  private:
    sf::RenderWindow &m_window;
    sf::Font m_font;
    bool m_font_loaded{false};
    bool m_animate;
    float m_move_anim_seconds;

    BoardView m_board_view;
    HighlightManager m_highlight_manager;
    PieceManager m_piece_manager;
    StatusView m_status_view;

    std::unique_ptr<animation::MoveAnim> m_anim;
    std::optional<core::Square> m_anim_target;
  };

} // namespace gambit::view
