#pragma once
#include <optional>
#include <utility>
#include <vector>

#include "gambit/chess_types.hpp"
#include "gambit/view/board_view.hpp"

namespace sf
{
  class Color;
  class RenderWindow;
}

namespace gambit::view
{

  class HighlightManager
  {
  public:
    explicit HighlightManager(const BoardView &boardRef);

    void highlightSelectSquare(core::Square pos);
    void highlightAttackSquare(core::Square pos, bool capture);
    void highlightHoverSquare(core::Square pos);
    void highlightLastMove(core::Square from, core::Square to);
    void highlightCheckSquare(core::Square pos);

    void clearSelectHighlight();
    void clearAttackHighlights();
    void clearHoverHighlight();
    void clearCheckHighlight();

    // Bottom layer: last move, check, selection. Top layer: hover, move markers.
    void renderUnderPieces(sf::RenderWindow &window) const;
    void renderOverPieces(sf::RenderWindow &window) const;

  private:
    struct AttackMark
    {
      core::Square square;
      bool capture{false};
    };

    void renderSquareFill(sf::RenderWindow &window, core::Square sq, const sf::Color &col) const;

    const BoardView &m_board_view_ref;

    std::optional<core::Square> m_select;
    std::optional<core::Square> m_hover;
    std::optional<core::Square> m_check;
    std::optional<std::pair<core::Square, core::Square>> m_last_move;
    std::vector<AttackMark> m_attack;
  };

} // namespace gambit::view
