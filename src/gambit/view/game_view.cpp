#include "gambit/view/game_view.hpp"

#include <SFML/Graphics.hpp>
#include <iostream>
#include <utility>

#include "gambit/view/animation/move_animation.hpp"
#include "gambit/view/render_constants.hpp"

namespace gambit::view
{

  GameView::GameView(sf::RenderWindow &window, const app::AppConfig &cfg)
      : m_window(window),
        m_font_loaded(m_font.loadFromFile(cfg.fontPath)),
        m_animate(cfg.animate && cfg.moveAnimMs > 0),
        m_move_anim_seconds(static_cast<float>(cfg.moveAnimMs) / 1000.f),
        m_board_view(cfg.squareSize, cfg.flipBoard),
        m_highlight_manager(m_board_view),
        m_piece_manager(m_board_view, m_font_loaded ? &m_font : nullptr),
        m_status_view(m_font_loaded ? &m_font : nullptr, cfg.squareSize)
  {
    if (!m_font_loaded)
      std::cerr << "[GameView] warning: could not load font " << cfg.fontPath
                << ", drawing pieces as shapes and the status in the title bar\n";

    const float boardPx = static_cast<float>(m_board_view.getBoardSize());
    const float barPx =
        static_cast<float>(constant::percentRound(cfg.squareSize, constant::STATUS_BAR_PCT));
    m_status_view.setPosition({0.f, boardPx}, {boardPx, barPx});
  }

  sf::Vector2u GameView::requiredWindowSize(const app::AppConfig &cfg)
  {
    const unsigned int boardPx = cfg.squareSize * constant::BOARD_SIZE;
    return {boardPx, boardPx + constant::percentRound(cfg.squareSize, constant::STATUS_BAR_PCT)};
  }

  void GameView::update(float dt)
  {
    if (!m_anim)
      return;
    m_anim->update(dt);
    if (m_anim->isFinished())
    {
      m_anim.reset();
      m_anim_target.reset();
    }
  }

  void GameView::render(const model::Position &pos)
  {
    m_board_view.renderBoard(m_window);
    m_highlight_manager.renderUnderPieces(m_window);
    m_piece_manager.renderPieces(pos, m_window, m_anim_target);
    m_highlight_manager.renderOverPieces(m_window);
    if (m_anim)
      m_anim->draw(m_window);
    m_status_view.render(m_window);
  }

  std::optional<core::Square> GameView::mousePosToSquare(sf::Vector2i mousePos) const
  {
    return m_board_view.mousePosToSquare(mousePos);
  }

  void GameView::setStatus(const model::GameStatus &status, core::Color sideToMove)
  {
    m_status_view.setStatus(status, sideToMove);
    // the banner needs a font; the title bar always shows the status
    m_window.setTitle(statusTitle(status, sideToMove));
  }

  void GameView::animateMove(const model::Move &m, std::function<void()> onComplete)
  {
    if (!m_animate)
    {
      if (onComplete)
        onComplete();
      return;
    }
    m_anim_target = m.to;
    m_anim = std::make_unique<animation::MoveAnim>(
        m_piece_manager, m.piece, m_board_view.getSquareScreenPos(m.from),
        m_board_view.getSquareScreenPos(m.to), m_move_anim_seconds, std::move(onComplete));
  }

  void GameView::highlightSelectSquare(core::Square sq) { m_highlight_manager.highlightSelectSquare(sq); }
  void GameView::highlightHoverSquare(core::Square sq) { m_highlight_manager.highlightHoverSquare(sq); }
  void GameView::highlightLegalTarget(core::Square sq, bool capture)
  {
    m_highlight_manager.highlightAttackSquare(sq, capture);
  }
  void GameView::highlightLastMove(core::Square from, core::Square to)
  {
    m_highlight_manager.highlightLastMove(from, to);
  }
  void GameView::highlightCheckSquare(core::Square sq) { m_highlight_manager.highlightCheckSquare(sq); }

  void GameView::clearSelection()
  {
    m_highlight_manager.clearSelectHighlight();
    m_highlight_manager.clearAttackHighlights();
  }
  void GameView::clearHover() { m_highlight_manager.clearHoverHighlight(); }
  void GameView::clearCheck() { m_highlight_manager.clearCheckHighlight(); }

} // namespace gambit::view
