#include "app/Config.h"
#include "app/GatewayApp.h"
#include "app/Logger.h"
#include "app/SignalHandler.h"
#include <cstring>
#include <iostream>

namespace {

void usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--config <path>] [--log-level DEBUG|INFO|WARN|ERROR]"
            << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  SignalHandler::init();

  std::string configPath = "../config/gateway.yaml";
  std::string logLevelOverride;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      logLevelOverride = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      usage(argv[0]);
      return 0;
    } else {
      usage(argv[0]);
      return 2;
    }
  }
  if (!logLevelOverride.empty())
    Logger::instance().setLevel(Logger::parseLevel(logLevelOverride));

  Config config;
  while (!config.load(configPath)) {
    int delay = config.supervisor.retryDelaySec > 0
                    ? config.supervisor.retryDelaySec
                    : 10;
    LOG_WARN("Retrying configuration load in " << delay << "s");
    if (!SignalHandler::sleepFor(std::chrono::seconds(delay)))
      return 1;
  }

  Logger::instance().setLevel(Logger::parseLevel(
      logLevelOverride.empty() ? config.logLevel : logLevelOverride));

  GatewayApp app(config);
  return app.run() ? 0 : 1;
}
