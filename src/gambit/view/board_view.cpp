#include "gambit/view/board_view.hpp"

#include <SFML/Graphics.hpp>

#include "gambit/view/render_constants.hpp"

namespace gambit::view
{

  BoardView::BoardView(unsigned int squarePx, bool flipped)
      : m_square_px(squarePx), m_flipped(flipped) {}

  unsigned int BoardView::getBoardSize() const
  {
    return m_square_px * constant::BOARD_SIZE;
  }

  void BoardView::renderBoard(sf::RenderWindow &window) const
  {
    const float size = static_cast<float>(m_square_px);
    sf::RectangleShape square({size, size});
    square.setOrigin(size * 0.5f, size * 0.5f);

    for (int idx = 0; idx < 64; ++idx)
    {
      const core::Square sq = core::Square::fromIndex(idx);
      // a1 is a dark square
      const bool light = ((sq.file() + sq.rank()) % 2) != 0;
      square.setFillColor(light ? constant::COL_LIGHT_SQUARE : constant::COL_DARK_SQUARE);
      square.setPosition(getSquareScreenPos(sq));
      window.draw(square);
    }
  }

  sf::Vector2f BoardView::getSquareScreenPos(core::Square sq) const
  {
    const int col = m_flipped ? 7 - sq.file() : sq.file();
    const int row = m_flipped ? sq.rank() : 7 - sq.rank();
    const float size = static_cast<float>(m_square_px);
    return {(static_cast<float>(col) + 0.5f) * size, (static_cast<float>(row) + 0.5f) * size};
  }

  std::optional<core::Square> BoardView::mousePosToSquare(sf::Vector2i mousePos) const
  {
    if (mousePos.x < 0 || mousePos.y < 0)
      return std::nullopt;
    const int col = mousePos.x / static_cast<int>(m_square_px);
    const int row = mousePos.y / static_cast<int>(m_square_px);
    if (col > 7 || row > 7)
      return std::nullopt;

    return m_flipped ? core::Square::at(7 - col, row) : core::Square::at(col, 7 - row);
  }

} // namespace gambit::view
