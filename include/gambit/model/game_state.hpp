#pragma once
#include <cstdint>
#include <optional>
#include <type_traits>

#include "core/model_types.hpp"

namespace gambit::model {

// Minimal record of the previous ply. Enough to know whether it was a pawn
// double push (the precondition for en passant).
struct LastMove {
  core::Square from{};
  core::Square to{};
  core::PieceType type = core::PieceType::Pawn;
  bool doublePush = false;

  friend constexpr bool operator==(const LastMove&, const LastMove&) = default;
};

struct GameState {
  core::Color sideToMove = core::Color::White;
  std::optional<LastMove> lastMove{};
  std::uint32_t plyCount = 0;
};

static_assert(std::is_trivially_copyable_v<LastMove>, "LastMove should be POD");
static_assert(sizeof(core::Color) <= 1, "core::Color should be 1 byte for compact state");

}  // namespace gambit::model
