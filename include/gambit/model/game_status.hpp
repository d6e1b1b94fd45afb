#pragma once
#include <cstdint>
#include <string>
#include <variant>

#include "../chess_types.hpp"

namespace gambit::model {

struct GameStatus {
  enum class Kind : std::uint8_t { InProgress, Check, Checkmate, Stalemate };

  Kind kind = Kind::InProgress;
  // Side whose king is attacked. Only meaningful for Check and Checkmate.
  core::Color color = core::Color::White;

  static constexpr GameStatus inProgress() noexcept { return {Kind::InProgress}; }
  static constexpr GameStatus check(core::Color c) noexcept { return {Kind::Check, c}; }
  static constexpr GameStatus checkmate(core::Color c) noexcept { return {Kind::Checkmate, c}; }
  static constexpr GameStatus stalemate() noexcept { return {Kind::Stalemate}; }

  [[nodiscard]] constexpr bool isTerminal() const noexcept {
    return kind == Kind::Checkmate || kind == Kind::Stalemate;
  }

  friend constexpr bool operator==(const GameStatus& a, const GameStatus& b) noexcept {
    if (a.kind != b.kind) return false;
    return (a.kind == Kind::Check || a.kind == Kind::Checkmate) ? a.color == b.color : true;
  }
};

enum class MoveError : std::uint8_t {
  IllegalMove,  // not in the legal move set of the current position
  GameOver      // game already ended in checkmate or stalemate
};

using MoveResult = std::variant<GameStatus, MoveError>;

inline std::string toString(const GameStatus& s) {
  switch (s.kind) {
    case GameStatus::Kind::InProgress:
      return "in progress";
    case GameStatus::Kind::Check:
      return std::string("check (") + core::toString(s.color) + ")";
    case GameStatus::Kind::Checkmate:
      return std::string("checkmate (") + core::toString(s.color) + ")";
    case GameStatus::Kind::Stalemate:
      return "stalemate";
  }
  return "unknown";
}

inline const char* toString(MoveError e) {
  return e == MoveError::IllegalMove ? "illegal move" : "game over";
}

}  // namespace gambit::model
