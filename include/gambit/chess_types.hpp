#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace gambit::core
{
  // (file, rank) with a1 = (0, 0). Coordinates are private and the factories
  // below only ever produce on-board values, so an off-board location is
  // always an empty optional.
  class Square
  {
  public:
    constexpr Square() noexcept = default;

    static constexpr std::optional<Square> at(int file, int rank) noexcept
    {
      if (file < 0 || file > 7 || rank < 0 || rank > 7) return std::nullopt;
      return Square{static_cast<std::uint8_t>(file), static_cast<std::uint8_t>(rank)};
    }

    // Wraps into 0..63.
    static constexpr Square fromIndex(int idx) noexcept
    {
      return Square{static_cast<std::uint8_t>(idx & 7), static_cast<std::uint8_t>((idx >> 3) & 7)};
    }

    [[nodiscard]] constexpr int file() const noexcept { return m_file; }
    [[nodiscard]] constexpr int rank() const noexcept { return m_rank; }
    [[nodiscard]] constexpr int index() const noexcept { return m_rank * 8 + m_file; }

    [[nodiscard]] constexpr std::optional<Square> offset(int df, int dr) const noexcept
    {
      return at(m_file + df, m_rank + dr);
    }

    friend constexpr bool operator==(const Square &, const Square &) = default;

  private:
    constexpr Square(std::uint8_t file, std::uint8_t rank) noexcept : m_file(file), m_rank(rank) {}

    std::uint8_t m_file = 0;
    std::uint8_t m_rank = 0;
  };

  inline std::string toString(Square sq)
  {
    return {static_cast<char>('a' + sq.file()), static_cast<char>('1' + sq.rank())};
  }

  constexpr std::uint8_t NUM_PIECE_TYPES = 6;
  enum class PieceType : std::uint8_t
  {
    Pawn = 0,
    Knight,
    Bishop,
    Rook,
    Queen,
    King
  };

  constexpr int idx(PieceType p) noexcept
  {
    return static_cast<int>(p);
  }

  enum class Color : std::uint8_t
  {
    White = 0,
    Black = 1
  };
  constexpr inline core::Color operator~(core::Color c)
  {
    return c == core::Color::White ? core::Color::Black : core::Color::White;
  }

  inline const char *toString(Color c)
  {
    return c == Color::White ? "White" : "Black";
  }
} // namespace gambit::core
