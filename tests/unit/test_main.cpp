#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "app/Logger.h"

int main(int argc, char *argv[]) {
  // Components log freely; keep the test report readable.
  Logger::instance().setLevel(LogLevel::ERROR);
  return Catch::Session().run(argc, argv);
}
