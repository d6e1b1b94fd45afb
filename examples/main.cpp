#include <exception>
#include <iostream>

#include "gambit/app/app.hpp"
#include "gambit/app/app_config.hpp"

int main(int argc, char** argv)
{
  gambit::app::AppConfig cfg;
  try
  {
    cfg = gambit::app::parseArgs(argc, argv);
  }
  catch (const std::exception& ex)
  {
    std::cerr << "Error: " << ex.what() << "\n";
    gambit::app::printUsage(std::cerr);
    return 1;
  }

  if (cfg.showHelp)
  {
    gambit::app::printUsage(std::cout);
    return 0;
  }

  gambit::app::App app(cfg);
  return app.run();
}
