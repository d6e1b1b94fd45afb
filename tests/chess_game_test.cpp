#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "gambit/model/chess_game.hpp"

using namespace gambit;
using model::bb::Piece;
using model::GameStatus;
using model::MoveError;
using PT = core::PieceType;

static core::Square sq(char file, int rank)
{
  return *core::Square::at(file - 'a', rank - 1);
}

static constexpr Piece W(core::PieceType t) { return {t, core::Color::White}; }
static constexpr Piece B(core::PieceType t) { return {t, core::Color::Black}; }

// "e2e4" -> applyMove(e2, e4)
static model::MoveResult play(model::ChessGame& game, const std::string& uci)
{
  return game.applyMove(sq(uci[0], uci[1] - '0'), sq(uci[2], uci[3] - '0'));
}

static bool isStatus(const model::MoveResult& res, GameStatus expected)
{
  const auto* st = std::get_if<GameStatus>(&res);
  return st && *st == expected;
}

static bool isError(const model::MoveResult& res, MoveError expected)
{
  const auto* err = std::get_if<MoveError>(&res);
  return err && *err == expected;
}

static std::vector<int> keys(std::vector<model::Move> moves)
{
  std::vector<int> out;
  for (const auto& m : moves) out.push_back(m.from.index() * 64 + m.to.index());
  std::sort(out.begin(), out.end());
  return out;
}

int main()
{
  // Start position: 20 legal moves, nobody in check
  {
    model::ChessGame game;
    assert(game.status() == GameStatus::inProgress());
    assert(game.legalMoves().size() == 20);
    assert(game.currentPosition().sideToMove() == core::Color::White);
    assert(game.currentPosition().kingsIntact());
    assert(!game.currentPosition().lastMove());
    assert(game.legalMovesFrom(sq('g', 1)).size() == 2);
    assert(game.legalMovesFrom(sq('e', 2)).size() == 2);
    assert(game.legalMovesFrom(sq('d', 1)).empty());
    assert(game.legalMovesFrom(sq('e', 4)).empty());
  }

  // 1.e4: Black has the standard 20 replies
  {
    model::ChessGame game;
    assert(isStatus(play(game, "e2e4"), GameStatus::inProgress()));

    const auto& pos = game.currentPosition();
    assert(pos.sideToMove() == core::Color::Black);
    assert(!pos.pieceAt(sq('e', 2)));
    assert(pos.pieceAt(sq('e', 4)) == W(PT::Pawn));
    assert(pos.lastMoveWasDoublePush());
    assert(pos.lastMove()->from == sq('e', 2) && pos.lastMove()->type == PT::Pawn);
    assert(pos.getState().plyCount == 1);
    assert(pos.kingCount(core::Color::White) == 1 && pos.kingCount(core::Color::Black) == 1);

    const auto replies = game.legalMoves();
    assert(replies.size() == 20);
    for (const auto& m : replies) assert(m.piece.color == core::Color::Black);
    assert(game.status() == GameStatus::inProgress());
  }

  // Fool's mate
  {
    model::ChessGame game;
    assert(isStatus(play(game, "f2f3"), GameStatus::inProgress()));
    assert(isStatus(play(game, "e7e5"), GameStatus::inProgress()));
    assert(isStatus(play(game, "g2g4"), GameStatus::inProgress()));
    assert(isStatus(play(game, "d8h4"), GameStatus::checkmate(core::Color::White)));

    assert(game.status() == GameStatus::checkmate(core::Color::White));
    assert(game.status().isTerminal());
    assert(game.legalMoves().empty());
    assert(model::toString(game.status()) == "checkmate (White)");

    // no further input once the game is over
    assert(isError(play(game, "a2a3"), MoveError::GameOver));
    assert(isError(play(game, "e5e4"), MoveError::GameOver));
    assert(game.currentPosition().sideToMove() == core::Color::White);
    assert(game.moveHistory().size() == 4);
  }

  // Stalemate: White Ka1, Black Kc2 + Qb3, White to move
  {
    model::Position pos({{sq('a', 1), W(PT::King)},
                         {sq('c', 2), B(PT::King)},
                         {sq('b', 3), B(PT::Queen)}},
                        core::Color::White);
    model::ChessGame game(pos);
    assert(game.status() == GameStatus::stalemate());
    assert(game.status() != GameStatus::checkmate(core::Color::White));
    assert(game.legalMoves().empty());
    assert(isError(play(game, "a1b1"), MoveError::GameOver));
  }

  // Bare kings are not a special draw: plain legal-move count rule
  {
    model::Position pos({{sq('e', 1), W(PT::King)}, {sq('e', 8), B(PT::King)}},
                        core::Color::White);
    model::ChessGame game(pos);
    assert(game.status() == GameStatus::inProgress());
    assert(game.legalMoves().size() == 5);
  }

  // Check with an escape; moving into or staying in check is rejected
  {
    model::ChessGame game;
    assert(isStatus(play(game, "e2e4"), GameStatus::inProgress()));
    assert(isStatus(play(game, "f7f6"), GameStatus::inProgress()));
    assert(isStatus(play(game, "d1h5"), GameStatus::check(core::Color::Black)));
    assert(game.status() == GameStatus::check(core::Color::Black));
    assert(!game.status().isTerminal());

    const auto before = game.currentPosition().toAscii();
    assert(isError(play(game, "a7a6"), MoveError::IllegalMove));
    assert(std::string(model::toString(MoveError::IllegalMove)) == "illegal move");
    assert(game.currentPosition().toAscii() == before);
    assert(game.currentPosition().sideToMove() == core::Color::Black);

    const auto legal = game.legalMoves();
    assert(legal.size() == 1);
    assert(legal[0].from == sq('g', 7) && legal[0].to == sq('g', 6));
    assert(isStatus(play(game, "g7g6"), GameStatus::inProgress()));
  }

  // Illegal candidates: wrong geometry, wrong colour, malformed move values
  {
    model::ChessGame game;
    assert(isError(play(game, "e2e5"), MoveError::IllegalMove));
    assert(isError(play(game, "e7e5"), MoveError::IllegalMove));
    assert(isError(play(game, "e3e4"), MoveError::IllegalMove));
    assert(isError(play(game, "b1d2"), MoveError::IllegalMove));

    model::Move bogus{sq('e', 2), sq('e', 4), W(PT::Knight), std::nullopt, true};
    assert(isError(game.applyMove(bogus), MoveError::IllegalMove));
    model::Move wrongCapture{sq('e', 2), sq('e', 4), W(PT::Pawn), B(PT::Pawn), true};
    assert(isError(game.applyMove(wrongCapture), MoveError::IllegalMove));
    assert(game.moveHistory().empty());

    // the double-push flag is derived from the geometry, not trusted from the caller
    model::Move noFlag{sq('e', 2), sq('e', 4), W(PT::Pawn), std::nullopt, false};
    assert(isStatus(game.applyMove(noFlag), GameStatus::inProgress()));
    assert(game.moveHistory().size() == 1);
    assert(game.moveHistory()[0].doublePush);
    assert(game.currentPosition().lastMoveWasDoublePush());

    model::Move flagged{sq('e', 7), sq('e', 6), B(PT::Pawn), std::nullopt, true};
    assert(isStatus(game.applyMove(flagged), GameStatus::inProgress()));
    assert(!game.moveHistory()[1].doublePush);
    assert(!game.currentPosition().lastMoveWasDoublePush());
  }

  // Coordinates from an input layer: off-board never yields a Square, and any
  // Square that does exist is safe to hand to the game
  {
    model::ChessGame game;
    int onBoard = 0;
    for (int file = -2; file < 10; ++file) {
      for (int rank = -2; rank < 10; ++rank) {
        const auto from = core::Square::at(file, rank);
        if (!from) {
          assert(file < 0 || file > 7 || rank < 0 || rank > 7);
          continue;
        }
        ++onBoard;
        assert(isError(game.applyMove(*from, *from), MoveError::IllegalMove));
      }
    }
    assert(onBoard == 64);
    assert(isError(game.applyMove(core::Square{}, core::Square{}), MoveError::IllegalMove));
    assert(game.moveHistory().empty());
    assert(game.currentPosition().sideToMove() == core::Color::White);
  }

  // Moving into check is never legal
  {
    model::Position pos({{sq('e', 1), W(PT::King)},
                         {sq('d', 8), B(PT::Rook)},
                         {sq('h', 8), B(PT::King)}},
                        core::Color::White);
    model::ChessGame game(pos);
    const auto kingMoves = game.legalMovesFrom(sq('e', 1));
    for (const auto& m : kingMoves) assert(m.to.file() != 3);
    assert(kingMoves.size() == 3);
    assert(isError(play(game, "e1d1"), MoveError::IllegalMove));
  }

  // Legal move generation is deterministic and leaves the position alone
  {
    model::ChessGame game;
    play(game, "e2e4");
    play(game, "d7d5");
    const auto ascii = game.currentPosition().toAscii();
    assert(keys(game.legalMoves()) == keys(game.legalMoves()));
    assert(game.currentPosition().toAscii() == ascii);
  }

  // Scripted game with captures and checks; both kings survive every move
  {
    model::ChessGame game;
    const std::vector<std::pair<std::string, GameStatus>> script = {
        {"e2e4", GameStatus::inProgress()}, {"e7e5", GameStatus::inProgress()},
        {"g1f3", GameStatus::inProgress()}, {"b8c6", GameStatus::inProgress()},
        {"f1b5", GameStatus::inProgress()}, {"a7a6", GameStatus::inProgress()},
        {"b5c6", GameStatus::inProgress()}, {"d7c6", GameStatus::inProgress()},
        {"f3e5", GameStatus::inProgress()}, {"d8d4", GameStatus::inProgress()},
        {"e5f3", GameStatus::inProgress()}, {"d4e4", GameStatus::check(core::Color::White)},
        {"d1e2", GameStatus::inProgress()}, {"e4e2", GameStatus::check(core::Color::White)},
        {"e1e2", GameStatus::inProgress()},
    };

    core::Color mover = core::Color::White;
    for (const auto& [uci, expected] : script) {
      const auto from = sq(uci[0], uci[1] - '0');
      const auto to = sq(uci[2], uci[3] - '0');
      const auto moving = game.currentPosition().pieceAt(from);
      assert(moving && moving->color == mover);

      assert(isStatus(play(game, uci), expected));

      const auto& pos = game.currentPosition();
      assert(pos.kingsIntact());
      assert(pos.sideToMove() == ~mover);
      assert(!pos.pieceAt(from));
      assert(pos.pieceAt(to) == *moving);
      mover = ~mover;
    }

    const auto& history = game.moveHistory();
    assert(history.size() == script.size());
    assert(history[6].captured == B(PT::Knight));
    assert(history[7].captured == W(PT::Bishop));
    assert(history[13].captured == W(PT::Queen));
    assert(history[14].captured == B(PT::Queen));
    assert(history[14].piece == W(PT::King));
    assert(!history[2].isCapture());
    assert(model::toString(history[2]) == "g1f3");
  }

  // Constructed positions must have one king per side and no shared squares
  {
    bool threw = false;
    try {
      model::Position noBlackKing({{sq('e', 1), W(PT::King)}}, core::Color::White);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      model::Position twoKings({{sq('e', 1), W(PT::King)},
                                {sq('d', 1), W(PT::King)},
                                {sq('e', 8), B(PT::King)}},
                               core::Color::White);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      model::Position clash({{sq('e', 1), W(PT::King)},
                             {sq('e', 8), B(PT::King)},
                             {sq('e', 1), B(PT::Rook)}},
                            core::Color::White);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "chess_game_test passed\n";
  return 0;
}
