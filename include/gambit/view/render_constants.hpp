#pragma once

#include <SFML/Graphics/Color.hpp>
#include <cstdint>
#include <string_view>

namespace gambit::view::constant
{

  // ------------------ Board / Window Metrics ------------------
  inline constexpr std::uint32_t BOARD_SIZE = 8;
  inline constexpr std::string_view WINDOW_TITLE{"Gambit"};

  // integer rounding helpers (percent of square)
  inline constexpr std::uint32_t percentRound(std::uint32_t v, std::uint32_t pct)
  {
    return (v * pct + 50u) / 100u;
  }

  // status banner below the board, relative to one square
  inline constexpr std::uint32_t STATUS_BAR_PCT = 75;
  inline constexpr std::uint32_t STATUS_FONT_PCT = 32;
  inline constexpr std::uint32_t PIECE_FONT_PCT = 80;
  inline constexpr std::uint32_t MOVE_DOT_PCT = 30;
  inline constexpr std::uint32_t PIECE_SHAPE_PCT = 34;

  // ------------------ Colours ------------------
  inline const sf::Color COL_BG{38, 36, 33};
  inline const sf::Color COL_LIGHT_SQUARE{238, 238, 210};
  inline const sf::Color COL_DARK_SQUARE{118, 150, 86};
  inline const sf::Color COL_HOVER{255, 255, 255, 60};
  inline const sf::Color COL_SELECT{246, 246, 105, 160};
  inline const sf::Color COL_LAST_MOVE{246, 246, 105, 90};
  inline const sf::Color COL_MOVE_DOT{0, 0, 0, 70};
  inline const sf::Color COL_CHECK{220, 40, 40, 170};

  inline const sf::Color COL_WHITE_PIECE{250, 250, 245};
  inline const sf::Color COL_BLACK_PIECE{30, 30, 30};
  inline const sf::Color COL_PIECE_OUTLINE_ON_WHITE{40, 40, 40};
  inline const sf::Color COL_PIECE_OUTLINE_ON_BLACK{200, 200, 200};

  inline const sf::Color COL_STATUS_TEXT{235, 235, 235};
  inline const sf::Color COL_STATUS_TERMINAL{255, 200, 90};

} // namespace gambit::view::constant
