#include "gambit/model/legality.hpp"

#include "gambit/model/attack_oracle.hpp"

namespace gambit::model {

namespace {

void keepLegal(const Position& pos, const std::vector<Move>& pseudo, std::vector<Move>& out) {
  for (const auto& m : pseudo) {
    if (isLegal(pos, m)) out.push_back(m);
  }
}

}  // namespace

bool isLegal(const Position& pos, const Move& m) {
  Position scratch = pos;
  scratch.doMove(m);
  return !isKingAttacked(scratch.getBoard(), m.piece.color);
}

void generateLegalMoves(const Position& pos, std::vector<Move>& out) {
  std::vector<Move> pseudo;
  pseudo.reserve(64);
  MoveGenerator{}.generatePseudoLegalMoves(pos, pseudo);
  keepLegal(pos, pseudo, out);
}

std::vector<Move> legalMovesFrom(const Position& pos, core::Square from) {
  std::vector<Move> pseudo;
  MoveGenerator{}.generatePseudoLegalMovesFrom(pos, from, pseudo);
  std::vector<Move> out;
  keepLegal(pos, pseudo, out);
  return out;
}

GameStatus computeStatus(const Position& pos) {
  const core::Color side = pos.sideToMove();
  const bool attacked = isKingAttacked(pos.getBoard(), side);

  std::vector<Move> legal;
  legal.reserve(64);
  generateLegalMoves(pos, legal);

  if (legal.empty()) return attacked ? GameStatus::checkmate(side) : GameStatus::stalemate();
  return attacked ? GameStatus::check(side) : GameStatus::inProgress();
}

}  // namespace gambit::model
