#include "gambit/view/highlight_manager.hpp"

#include <SFML/Graphics.hpp>

#include "gambit/view/render_constants.hpp"

namespace gambit::view
{

  HighlightManager::HighlightManager(const BoardView &boardRef)
      : m_board_view_ref(boardRef) {}

  void HighlightManager::highlightSelectSquare(core::Square pos) { m_select = pos; }
  void HighlightManager::highlightHoverSquare(core::Square pos) { m_hover = pos; }
  void HighlightManager::highlightCheckSquare(core::Square pos) { m_check = pos; }

  void HighlightManager::highlightAttackSquare(core::Square pos, bool capture)
  {
    m_attack.push_back({pos, capture});
  }

  void HighlightManager::highlightLastMove(core::Square from, core::Square to)
  {
    m_last_move = std::make_pair(from, to);
  }

  void HighlightManager::clearSelectHighlight() { m_select.reset(); }
  void HighlightManager::clearAttackHighlights() { m_attack.clear(); }
  void HighlightManager::clearHoverHighlight() { m_hover.reset(); }
  void HighlightManager::clearCheckHighlight() { m_check.reset(); }

  void HighlightManager::renderSquareFill(sf::RenderWindow &window, core::Square sq,
                                          const sf::Color &col) const
  {
    const float size = static_cast<float>(m_board_view_ref.getSquareSize());
    sf::RectangleShape rect({size, size});
    rect.setOrigin(size * 0.5f, size * 0.5f);
    rect.setPosition(m_board_view_ref.getSquareScreenPos(sq));
    rect.setFillColor(col);
    window.draw(rect);
  }

  void HighlightManager::renderUnderPieces(sf::RenderWindow &window) const
  {
    if (m_last_move)
    {
      renderSquareFill(window, m_last_move->first, constant::COL_LAST_MOVE);
      renderSquareFill(window, m_last_move->second, constant::COL_LAST_MOVE);
    }
    if (m_check)
      renderSquareFill(window, *m_check, constant::COL_CHECK);
    if (m_select)
      renderSquareFill(window, *m_select, constant::COL_SELECT);
  }

  void HighlightManager::renderOverPieces(sf::RenderWindow &window) const
  {
    const unsigned int sqPx = m_board_view_ref.getSquareSize();

    for (const auto &mark : m_attack)
    {
      const sf::Vector2f center = m_board_view_ref.getSquareScreenPos(mark.square);
      if (mark.capture)
      {
        // ring around the victim
        const float thickness = static_cast<float>(sqPx) * 0.08f;
        const float r = static_cast<float>(sqPx) * 0.5f - thickness;
        sf::CircleShape ring(r);
        ring.setOrigin(r, r);
        ring.setPosition(center);
        ring.setFillColor(sf::Color::Transparent);
        ring.setOutlineThickness(thickness);
        ring.setOutlineColor(constant::COL_MOVE_DOT);
        window.draw(ring);
      }
      else
      {
        const float r = static_cast<float>(constant::percentRound(sqPx, constant::MOVE_DOT_PCT)) * 0.5f;
        sf::CircleShape dot(r);
        dot.setOrigin(r, r);
        dot.setPosition(center);
        dot.setFillColor(constant::COL_MOVE_DOT);
        window.draw(dot);
      }
    }

    if (m_hover)
      renderSquareFill(window, *m_hover, constant::COL_HOVER);
  }

} // namespace gambit::view
