#include "gambit/view/animation/move_animation.hpp"

#include <algorithm>
#include <utility>

namespace gambit::view::animation {

MoveAnim::MoveAnim(const PieceManager& pieceMgrRef, model::bb::Piece piece, sf::Vector2f s,
                   sf::Vector2f e, float duration, std::function<void()> onComplete)
    : m_piece_manager_ref(pieceMgrRef),
      m_piece(piece),
      m_start_pos(s),
      m_end_pos(e),
      m_current_pos(s),
      m_duration(duration),
      m_on_complete(std::move(onComplete)) {}

void MoveAnim::update(float dt) {
  if (m_finish) return;
  m_elapsed += dt;
  const float t = m_duration > 0.f ? std::min(m_elapsed / m_duration, 1.f) : 1.f;
  m_current_pos = m_start_pos + t * (m_end_pos - m_start_pos);

  if (t >= 1.f) {
    m_finish = true;
    if (m_on_complete) m_on_complete();
  }
}

void MoveAnim::draw(sf::RenderWindow& window) const {
  m_piece_manager_ref.renderPieceAt(m_piece, m_current_pos, window);
}

bool MoveAnim::isFinished() const {
  return m_finish;
}

}  // namespace gambit::view::animation
