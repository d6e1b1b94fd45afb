#pragma once

#include <vector>

#include "game_status.hpp"
#include "move.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace gambit::model {

// A pseudo-legal move is legal if, played on a scratch copy of `pos`, it does
// not leave the mover's king attacked. `pos` itself is never touched.
[[nodiscard]] bool isLegal(const Position& pos, const Move& m);

// Legal moves of the side to move, appended to `out`. Order is unspecified.
void generateLegalMoves(const Position& pos, std::vector<Move>& out);

[[nodiscard]] std::vector<Move> legalMovesFrom(const Position& pos, core::Square from);

// Pure function of the position: king attacked x any legal move.
[[nodiscard]] GameStatus computeStatus(const Position& pos);

}  // namespace gambit::model
