#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include "gambit/model/chess_game.hpp"
#include "gambit/view/status_view.hpp"

using namespace gambit;
using model::GameStatus;

static core::Square sq(char file, int rank)
{
  return *core::Square::at(file - 'a', rank - 1);
}

int main()
{
  // Wording for every status kind
  {
    assert(view::statusText(GameStatus::inProgress(), core::Color::White) == "White to move");
    assert(view::statusText(GameStatus::inProgress(), core::Color::Black) == "Black to move");
    assert(view::statusText(GameStatus::check(core::Color::Black), core::Color::Black) ==
           "Black to move (check)");
    assert(view::statusText(GameStatus::checkmate(core::Color::White), core::Color::White) ==
           "Checkmate! Black wins");
    assert(view::statusText(GameStatus::stalemate(), core::Color::White) == "Stalemate");
  }

  // The title bar carries the same text, so the status shows without a font
  {
    assert(view::statusTitle(GameStatus::inProgress(), core::Color::White) ==
           "Gambit: White to move");
    assert(view::statusTitle(GameStatus::stalemate(), core::Color::Black) == "Gambit: Stalemate");
  }

  // Driven from a real game: fool's mate ends with White mated
  {
    model::ChessGame game;
    game.applyMove(sq('f', 2), sq('f', 3));
    game.applyMove(sq('e', 7), sq('e', 5));
    game.applyMove(sq('g', 2), sq('g', 4));
    game.applyMove(sq('d', 8), sq('h', 4));
    const auto& pos = game.currentPosition();
    assert(view::statusTitle(game.status(), pos.sideToMove()) == "Gambit: Checkmate! Black wins");
  }

  std::cout << "status_view_test passed\n";
  return 0;
}
