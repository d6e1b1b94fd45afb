#pragma once

#include <SFML/System/Vector2.hpp>
#include <string>

#include "gambit/model/game_status.hpp"

namespace sf
{
  class Font;
  class RenderWindow;
}

namespace gambit::view
{

  // Banner wording, e.g. "Checkmate! Black wins".
  std::string statusText(const model::GameStatus &status, core::Color sideToMove);
  // Window title carrying the same wording, e.g. "Gambit: White to move".
  std::string statusTitle(const model::GameStatus &status, core::Color sideToMove);

  class StatusView
  {
  public:
    StatusView(const sf::Font *font, unsigned int squarePx);

    void setStatus(const model::GameStatus &status, core::Color sideToMove);
    void setPosition(sf::Vector2f topLeft, sf::Vector2f size);
    void render(sf::RenderWindow &window) const;

  private:
    const sf::Font *m_font;
    unsigned int m_square_px;
    std::string m_text;
    bool m_terminal{false};
    sf::Vector2f m_top_left{};
    sf::Vector2f m_size{};
  };

} // namespace gambit::view
