#include <signal.h>  // for signal, SIGINT, SIGTERM
#include <stdlib.h>  // for getenv
#include <unistd.h>  // for usleep
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "ChipLogger.h"  // for setDefaultLogger, CHIP_LOG
#include "HTTPServer.h"
#include "JsonCatalogStore.h"
#include "ServerConfig.h"
#include "SongService.h"
#include "WebApi.h"

static std::atomic<bool> running{true};

static void onSignal(int) {
  running = false;
}

int main(int argc, char** argv) {
  chipstream::setDefaultLogger();
  chipstream::enableTimestampLogging();
  chipstream::enableSubmoduleLogging();

  chipstream::ServerConfig config;
  const char* envConfig = getenv("CHIPSTREAM_CONFIG");
  if (argc > 1) {
    config = chipstream::ServerConfig::load(argv[1]);
  } else if (envConfig != nullptr && envConfig[0] != '\0') {
    config = chipstream::ServerConfig::load(envConfig);
  }
  chipstream::setLogLevel(chipstream::parseLogLevel(config.logLevel));

  std::error_code ec;
  std::filesystem::create_directories(config.uploadDir, ec);
  if (ec) {
    CHIP_LOG(error, "main", "Cannot create upload directory %s: %s",
             config.uploadDir.c_str(), ec.message().c_str());
    return 1;
  }

  auto catalog =
      std::make_shared<chipstream::JsonCatalogStore>(config.catalogPath);
  chipstream::SongService service(catalog, config);

  signal(SIGINT, onSignal);
  signal(SIGTERM, onSignal);

  chipstream::HTTPServer server(config.port, config.civetOptions());
  chipstream::registerSongApi(server, service, config);
  if (!server.start()) {
    CHIP_LOG(error, "main", "Could not bind port %d", config.port);
    return 1;
  }

  CHIP_LOG(info, "main", "ChipStream running at http://localhost:%d",
           config.port);
  CHIP_LOG(info, "main", "Uploads dir: %s",
           std::filesystem::absolute(config.uploadDir, ec).string().c_str());
  CHIP_LOG(info, "main", "Database:    %s",
           std::filesystem::absolute(config.catalogPath, ec).string().c_str());

  while (running) {
    usleep(200 * 1000);
  }

  CHIP_LOG(info, "main", "Shutting down");
  return 0;
}
