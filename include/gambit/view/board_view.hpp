#pragma once

#include <SFML/System/Vector2.hpp>
#include <optional>

#include "gambit/chess_types.hpp"

namespace sf
{
  class RenderWindow;
}

namespace gambit::view
{

  class BoardView
  {
  public:
    BoardView(unsigned int squarePx, bool flipped);

    void renderBoard(sf::RenderWindow &window) const;

    // Centre of `sq` in window coordinates.
    [[nodiscard]] sf::Vector2f getSquareScreenPos(core::Square sq) const;
    // Empty when the position lies outside the board.
    [[nodiscard]] std::optional<core::Square> mousePosToSquare(sf::Vector2i mousePos) const;

    [[nodiscard]] unsigned int getSquareSize() const { return m_square_px; }
    [[nodiscard]] unsigned int getBoardSize() const;

  private:
    unsigned int m_square_px;
    bool m_flipped;
  };

} // namespace gambit::view
