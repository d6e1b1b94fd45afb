#include "gambit/controller/selection_manager.hpp"

namespace gambit::controller {

SelectionManager::SelectionManager(view::GameView &view) : m_view(view) {}

void SelectionManager::reset() {
  m_view.clearSelection();
  m_view.clearHover();
  m_hover_sq.reset();
}

void SelectionManager::selectSquare(core::Square sq) {
  m_view.clearSelection();
  m_view.highlightSelectSquare(sq);
}

void SelectionManager::deselectSquare() {
  m_view.clearSelection();
}

void SelectionManager::hoverSquare(core::Square sq) {
  m_hover_sq = sq;
  m_view.highlightHoverSquare(sq);
}

void SelectionManager::dehoverSquare() {
  if (m_hover_sq) m_view.clearHover();
  m_hover_sq.reset();
}

void SelectionManager::setLastMove(core::Square from, core::Square to) {
  m_view.highlightLastMove(from, to);
}

} // namespace gambit::controller
