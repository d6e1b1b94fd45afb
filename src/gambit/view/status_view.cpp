#include "gambit/view/status_view.hpp"

#include <SFML/Graphics.hpp>

#include "gambit/view/render_constants.hpp"

namespace gambit::view
{

  std::string statusText(const model::GameStatus &status, core::Color sideToMove)
  {
    using Kind = model::GameStatus::Kind;
    switch (status.kind)
    {
    case Kind::InProgress:
      return std::string(core::toString(sideToMove)) + " to move";
    case Kind::Check:
      return std::string(core::toString(status.color)) + " to move (check)";
    case Kind::Checkmate:
      return std::string("Checkmate! ") + core::toString(~status.color) + " wins";
    case Kind::Stalemate:
      return "Stalemate";
    }
    return {};
  }

  std::string statusTitle(const model::GameStatus &status, core::Color sideToMove)
  {
    return std::string(constant::WINDOW_TITLE) + ": " + statusText(status, sideToMove);
  }

  StatusView::StatusView(const sf::Font *font, unsigned int squarePx)
      : m_font(font), m_square_px(squarePx) {}

  void StatusView::setStatus(const model::GameStatus &status, core::Color sideToMove)
  {
    m_text = statusText(status, sideToMove);
    m_terminal = status.isTerminal();
  }

  void StatusView::setPosition(sf::Vector2f topLeft, sf::Vector2f size)
  {
    m_top_left = topLeft;
    m_size = size;
  }

  void StatusView::render(sf::RenderWindow &window) const
  {
    sf::RectangleShape bar(m_size);
    bar.setPosition(m_top_left);
    bar.setFillColor(constant::COL_BG);
    window.draw(bar);

    if (!m_font)
      return;

    const unsigned int charSize = constant::percentRound(m_square_px, constant::STATUS_FONT_PCT);
    sf::Text text(m_text, *m_font, charSize);
    text.setFillColor(m_terminal ? constant::COL_STATUS_TERMINAL : constant::COL_STATUS_TEXT);

    const sf::FloatRect b = text.getLocalBounds();
    text.setOrigin(b.left + b.width * 0.5f, b.top + b.height * 0.5f);
    text.setPosition(m_top_left.x + m_size.x * 0.5f, m_top_left.y + m_size.y * 0.5f);
    window.draw(text);
  }

} // namespace gambit::view
