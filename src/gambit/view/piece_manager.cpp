#include "gambit/view/piece_manager.hpp"

#include <SFML/Graphics.hpp>
#include <cstddef>
#include <utility>

#include "gambit/view/render_constants.hpp"

namespace gambit::view
{

  namespace
  {

    // Solid glyph set U+265A..U+265F, tinted per side.
    sf::Uint32 glyphFor(core::PieceType t)
    {
      switch (t)
      {
      case core::PieceType::King:
        return 0x265A;
      case core::PieceType::Queen:
        return 0x265B;
      case core::PieceType::Rook:
        return 0x265C;
      case core::PieceType::Bishop:
        return 0x265D;
      case core::PieceType::Knight:
        return 0x265E;
      case core::PieceType::Pawn:
        return 0x265F;
      }
      return '?';
    }

    // Fallback silhouettes: point count and relative radius per kind.
    std::pair<std::size_t, float> shapeFor(core::PieceType t)
    {
      switch (t)
      {
      case core::PieceType::Pawn:
        return {24, 0.65f};
      case core::PieceType::Knight:
        return {3, 0.95f};
      case core::PieceType::Bishop:
        return {4, 0.9f};
      case core::PieceType::Rook:
        return {4, 0.85f};
      case core::PieceType::Queen:
        return {8, 1.f};
      case core::PieceType::King:
        return {6, 1.05f};
      }
      return {24, 1.f};
    }

  } // namespace

  PieceManager::PieceManager(const BoardView &boardRef, const sf::Font *font)
      : m_board_view_ref(boardRef), m_font(font) {}

  void PieceManager::renderPieces(const model::Position &pos, sf::RenderWindow &window,
                                  std::optional<core::Square> skip) const
  {
    for (int idx = 0; idx < 64; ++idx)
    {
      const core::Square sq = core::Square::fromIndex(idx);
      if (skip && *skip == sq)
        continue;
      if (const auto piece = pos.pieceAt(sq))
        renderPieceAt(*piece, m_board_view_ref.getSquareScreenPos(sq), window);
    }
  }

  void PieceManager::renderPieceAt(model::bb::Piece piece, sf::Vector2f center,
                                   sf::RenderWindow &window) const
  {
    if (m_font)
      renderGlyph(piece, center, window);
    else
      renderShape(piece, center, window);
  }

  void PieceManager::renderGlyph(model::bb::Piece piece, sf::Vector2f center,
                                 sf::RenderWindow &window) const
  {
    const unsigned int charSize =
        constant::percentRound(m_board_view_ref.getSquareSize(), constant::PIECE_FONT_PCT);
    sf::Text text(sf::String(glyphFor(piece.type)), *m_font, charSize);

    const bool white = piece.color == core::Color::White;
    text.setFillColor(white ? constant::COL_WHITE_PIECE : constant::COL_BLACK_PIECE);
    text.setOutlineColor(white ? constant::COL_PIECE_OUTLINE_ON_WHITE
                               : constant::COL_PIECE_OUTLINE_ON_BLACK);
    text.setOutlineThickness(1.5f);

    const sf::FloatRect b = text.getLocalBounds();
    text.setOrigin(b.left + b.width * 0.5f, b.top + b.height * 0.5f);
    text.setPosition(center);
    window.draw(text);
  }

  void PieceManager::renderShape(model::bb::Piece piece, sf::Vector2f center,
                                 sf::RenderWindow &window) const
  {
    const auto [points, scale] = shapeFor(piece.type);
    const float r = static_cast<float>(constant::percentRound(m_board_view_ref.getSquareSize(),
                                                              constant::PIECE_SHAPE_PCT)) *
                    scale;

    sf::CircleShape shape(r, points);
    shape.setOrigin(r, r);
    shape.setPosition(center);
    if (piece.type == core::PieceType::Bishop)
      shape.setRotation(45.f);

    const bool white = piece.color == core::Color::White;
    shape.setFillColor(white ? constant::COL_WHITE_PIECE : constant::COL_BLACK_PIECE);
    shape.setOutlineColor(white ? constant::COL_PIECE_OUTLINE_ON_WHITE
                                : constant::COL_PIECE_OUTLINE_ON_BLACK);
    shape.setOutlineThickness(2.f);
    window.draw(shape);
  }

} // namespace gambit::view
