#pragma once

#include "app_config.hpp"

namespace gambit::app {

class App {
 public:
  explicit App(AppConfig cfg);
  int run();

 private:
  AppConfig m_cfg;
};

}  // namespace gambit::app
