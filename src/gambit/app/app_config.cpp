#include "gambit/app/app_config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace gambit::app {

namespace {

long parseNumber(const std::string& name, const std::string& value, long lo, long hi) {
  char* end = nullptr;
  const long v = std::strtol(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0')
    throw std::invalid_argument("Invalid number for " + name + ": " + value);
  if (v < lo || v > hi)
    throw std::invalid_argument(name + " must be between " + std::to_string(lo) + " and " +
                                std::to_string(hi));
  return v;
}

}  // namespace

void printUsage(std::ostream& os) {
  os << "Usage: gambit [options]\n"
        "Options:\n"
        "  --square-size <px>   Board square size in pixels (default 96)\n"
        "  --font <path>        TrueType font for pieces and status text\n"
        "  --anim-ms <ms>       Move animation duration (default 150)\n"
        "  --no-anim            Disable move animation\n"
        "  --flip               Draw the board from Black's side\n"
        "  --help               Show this help\n";
}

AppConfig parseArgs(int argc, const char* const* argv) {
  AppConfig cfg;

  auto require_value = [&](int& i, const std::string& name) -> std::string {
    if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + name);
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--square-size") {
      cfg.squareSize = static_cast<unsigned int>(parseNumber(arg, require_value(i, arg), 32, 256));
    } else if (arg == "--font") {
      cfg.fontPath = require_value(i, arg);
    } else if (arg == "--anim-ms") {
      cfg.moveAnimMs = static_cast<int>(parseNumber(arg, require_value(i, arg), 0, 5000));
    } else if (arg == "--no-anim") {
      cfg.animate = false;
    } else if (arg == "--flip") {
      cfg.flipBoard = true;
    } else if (arg == "--help" || arg == "-h") {
      cfg.showHelp = true;
    } else {
      throw std::invalid_argument("Unknown option: " + arg);
    }
  }
  return cfg;
}

}  // namespace gambit::app
