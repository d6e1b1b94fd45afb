#include "gambit/app/app.hpp"

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>
#include <string>
#include <utility>

#include "gambit/controller/game_controller.hpp"
#include "gambit/model/chess_game.hpp"
#include "gambit/view/game_view.hpp"
#include "gambit/view/render_constants.hpp"

namespace gambit::app {

App::App(AppConfig cfg) : m_cfg(std::move(cfg)) {}

int App::run() {
  const sf::Vector2u size = view::GameView::requiredWindowSize(m_cfg);
  sf::RenderWindow window(sf::VideoMode(size.x, size.y),
                          std::string{view::constant::WINDOW_TITLE},
                          sf::Style::Titlebar | sf::Style::Close);
  window.setFramerateLimit(60);

  model::ChessGame chessGame;
  view::GameView gameView(window, m_cfg);
  controller::GameController gameController(gameView, chessGame);

  sf::Clock clock;
  while (window.isOpen()) {
    const float deltaSeconds = clock.restart().asSeconds();
    sf::Event event;
    while (window.pollEvent(event)) {
      if (event.type == sf::Event::Closed ||
          (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)) {
        window.close();
        break;
      }
      gameController.handleEvent(event);
    }
    if (!window.isOpen()) break;

    gameController.update(deltaSeconds);
    window.clear(view::constant::COL_BG);
    gameController.render();
    window.display();
  }

  return 0;
}

}  // namespace gambit::app
