#undef NDEBUG
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gambit/app/app_config.hpp"

using namespace gambit;

static app::AppConfig parse(std::vector<const char*> args)
{
  args.insert(args.begin(), "gambit");
  return app::parseArgs(static_cast<int>(args.size()), args.data());
}

static bool rejects(std::vector<const char*> args, const std::string& fragment)
{
  try {
    parse(std::move(args));
  } catch (const std::invalid_argument& ex) {
    return std::string(ex.what()).find(fragment) != std::string::npos;
  }
  return false;
}

int main()
{
  // No options: defaults
  {
    const auto cfg = parse({});
    assert(cfg.squareSize == 96);
    assert(cfg.fontPath == "assets/fonts/DejaVuSans.ttf");
    assert(cfg.moveAnimMs == 150);
    assert(cfg.animate);
    assert(!cfg.flipBoard);
    assert(!cfg.showHelp);
  }

  {
    const auto cfg = parse({"--square-size", "64", "--font", "/tmp/x.ttf", "--anim-ms", "0",
                            "--no-anim", "--flip"});
    assert(cfg.squareSize == 64);
    assert(cfg.fontPath == "/tmp/x.ttf");
    assert(cfg.moveAnimMs == 0);
    assert(!cfg.animate);
    assert(cfg.flipBoard);
  }

  assert(parse({"--help"}).showHelp);
  assert(parse({"-h"}).showHelp);

  // range ends are inclusive
  assert(parse({"--square-size", "32"}).squareSize == 32);
  assert(parse({"--square-size", "256"}).squareSize == 256);
  assert(parse({"--anim-ms", "5000"}).moveAnimMs == 5000);

  assert(rejects({"--bogus"}, "Unknown option: --bogus"));
  assert(rejects({"--square-size"}, "Missing value for --square-size"));
  assert(rejects({"--font"}, "Missing value for --font"));
  assert(rejects({"--square-size", "31"}, "--square-size"));
  assert(rejects({"--square-size", "257"}, "--square-size"));
  assert(rejects({"--square-size", "12px"}, "Invalid number"));
  assert(rejects({"--anim-ms", "-1"}, "--anim-ms"));
  assert(rejects({"--anim-ms", ""}, "Invalid number"));

  {
    std::ostringstream os;
    app::printUsage(os);
    const std::string text = os.str();
    assert(text.find("Usage: gambit") != std::string::npos);
    assert(text.find("--square-size") != std::string::npos);
    assert(text.find("--no-anim") != std::string::npos);
  }

  std::cout << "app_config_test passed\n";
  return 0;
}
