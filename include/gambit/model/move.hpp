#pragma once
#include <optional>
#include <string>

#include "core/model_types.hpp"

namespace gambit::model {

// A move is a value: it records what moves and what it removes, never a
// reference into a board.
struct Move {
  core::Square from{};
  core::Square to{};
  bb::Piece piece{};
  std::optional<bb::Piece> captured{};
  bool doublePush = false;  // pawn advanced two ranks from its start rank

  [[nodiscard]] constexpr bool isCapture() const noexcept { return captured.has_value(); }

  friend constexpr bool operator==(const Move&, const Move&) = default;
};

// Coordinate form, e.g. "e2e4".
inline std::string toString(const Move& m) {
  return core::toString(m.from) + core::toString(m.to);
}

}  // namespace gambit::model
