#include "gambit/model/position.hpp"

#include <array>
#include <stdexcept>

namespace gambit::model {

namespace {

using core::Color;
using core::PieceType;
using PT = core::PieceType;

constexpr std::array<PT, 8> kBackRank = {PT::Rook,  PT::Knight, PT::Bishop, PT::Queen,
                                         PT::King,  PT::Bishop, PT::Knight, PT::Rook};

std::vector<Placement> startingPlacements() {
  std::vector<Placement> out;
  out.reserve(32);
  for (int file = 0; file < 8; ++file) {
    out.push_back({*core::Square::at(file, 0), {kBackRank[file], Color::White}});
    out.push_back({*core::Square::at(file, 1), {PT::Pawn, Color::White}});
    out.push_back({*core::Square::at(file, 6), {PT::Pawn, Color::Black}});
    out.push_back({*core::Square::at(file, 7), {kBackRank[file], Color::Black}});
  }
  return out;
}

char pieceChar(bb::Piece p) noexcept {
  char ch = '?';
  switch (p.type) {
    case PT::Pawn:
      ch = 'p';
      break;
    case PT::Knight:
      ch = 'n';
      break;
    case PT::Bishop:
      ch = 'b';
      break;
    case PT::Rook:
      ch = 'r';
      break;
    case PT::Queen:
      ch = 'q';
      break;
    case PT::King:
      ch = 'k';
      break;
  }
  return p.color == Color::White ? static_cast<char>(ch - 'a' + 'A') : ch;
}

}  // namespace

Position::Position() {
  place(startingPlacements(), Color::White);
}

Position::Position(std::initializer_list<Placement> pieces, core::Color sideToMove) {
  place(std::vector<Placement>(pieces), sideToMove);
}

void Position::place(const std::vector<Placement>& pieces, core::Color sideToMove) {
  m_board.clear();
  m_state = GameState{};
  m_state.sideToMove = sideToMove;

  for (const auto& p : pieces) {
    if (m_board.getPiece(p.square))
      throw std::invalid_argument("Two pieces placed on " + core::toString(p.square));
    m_board.setPiece(p.square, p.piece);
  }
  if (kingCount(Color::White) != 1 || kingCount(Color::Black) != 1)
    throw std::invalid_argument("Position needs exactly one king per side");
}

std::optional<core::Square> Position::kingSquare(core::Color c) const noexcept {
  const bb::Bitboard kbb = m_board.getPieces(c, PT::King);
  if (!kbb) return std::nullopt;
  return core::Square::fromIndex(bb::ctz64(kbb));
}

void Position::doMove(const Move& m) {
  const auto mover = m_board.getPiece(m.from);
  if (!mover) return;

  m_board.removePiece(m.from);
  m_board.setPiece(m.to, *mover);

  m_state.lastMove = LastMove{m.from, m.to, mover->type, m.doublePush};
  m_state.sideToMove = ~m_state.sideToMove;
  ++m_state.plyCount;
}

std::string Position::toAscii() const {
  std::string out;
  out.reserve(72);
  for (int rank = 7; rank >= 0; --rank) {
    for (int file = 0; file < 8; ++file) {
      const auto piece = m_board.getPiece(*core::Square::at(file, rank));
      out.push_back(piece ? pieceChar(*piece) : '.');
    }
    out.push_back('\n');
  }
  return out;
}

}  // namespace gambit::model
