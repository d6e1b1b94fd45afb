#pragma once
#include <ostream>
#include <string>

namespace gambit::app {

struct AppConfig {
  unsigned int squareSize = 96;                         // px per board square
  std::string fontPath = "assets/fonts/DejaVuSans.ttf"; // glyphs for pieces and banner
  int moveAnimMs = 150;
  bool animate = true;
  bool flipBoard = false;  // Black at the bottom
  bool showHelp = false;
};

// Throws std::invalid_argument on unknown options, missing values and
// out-of-range numbers.
AppConfig parseArgs(int argc, const char* const* argv);

void printUsage(std::ostream& os);

}  // namespace gambit::app
