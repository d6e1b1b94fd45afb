#pragma once

#include <SFML/System/Vector2.hpp>
#include <functional>

#include "gambit/model/core/model_types.hpp"
#include "gambit/view/piece_manager.hpp"

namespace gambit::view::animation
{

  // Slides one piece from `s` to `e` in screen space, then fires onComplete.
  class MoveAnim
  {
  public:
    MoveAnim(const PieceManager &pieceMgrRef, model::bb::Piece piece, sf::Vector2f s,
             sf::Vector2f e, float duration, std::function<void()> onComplete = {});
    void update(float dt);
    void draw(sf::RenderWindow &window) const;
    [[nodiscard]] bool isFinished() const;

  private:
    const PieceManager &m_piece_manager_ref;
    model::bb::Piece m_piece;
    sf::Vector2f m_start_pos;
    sf::Vector2f m_end_pos;
    sf::Vector2f m_current_pos;
    float m_elapsed = 0.f;
    float m_duration;
    bool m_finish = false;
    std::function<void()> m_on_complete;
  };

}
