#pragma once

#include <SFML/System/Vector2.hpp>
#include <optional>

#include "gambit/model/core/model_types.hpp"
#include "gambit/model/position.hpp"
#include "gambit/view/board_view.hpp"

namespace sf
{
  class Font;
  class RenderWindow;
}

namespace gambit::view
{

  // Draws pieces as chess glyphs from the loaded font, or as simple shapes
  // when no font is available.
  class PieceManager
  {
  public:
    PieceManager(const BoardView &boardRef, const sf::Font *font);

    // Draws every piece of `pos` except the one on `skip` (the piece in flight).
    void renderPieces(const model::Position &pos, sf::RenderWindow &window,
                      std::optional<core::Square> skip = std::nullopt) const;
    void renderPieceAt(model::bb::Piece piece, sf::Vector2f center, sf::RenderWindow &window) const;

  private:
    void renderGlyph(model::bb::Piece piece, sf::Vector2f center, sf::RenderWindow &window) const;
    void renderShape(model::bb::Piece piece, sf::Vector2f center, sf::RenderWindow &window) const;

    const BoardView &m_board_view_ref;
    const sf::Font *m_font;
  };

} // namespace gambit::view
