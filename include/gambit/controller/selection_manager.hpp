#pragma once

#include <optional>

#include "gambit/chess_types.hpp"
#include "gambit/view/game_view.hpp"

namespace gambit::controller
{

  class SelectionManager
  {
  public:
    explicit SelectionManager(view::GameView &view);

    void reset();

    void selectSquare(core::Square sq);
    void deselectSquare();
    void hoverSquare(core::Square sq);
    void dehoverSquare();

    void setLastMove(core::Square from, core::Square to);

  private:
    view::GameView &m_view;
    std::optional<core::Square> m_hover_sq;
  };

} // namespace gambit::controller
