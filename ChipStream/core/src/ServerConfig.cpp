#include "ServerConfig.h"

#include <fstream>   // for ifstream
#include <iterator>  // for istreambuf_iterator

#include <nlohmann/json.hpp>  // for json

#include "ChipLogger.h"  // for CHIP_LOG

using namespace chipstream;

ServerConfig ServerConfig::load(const std::string& path) {
  ServerConfig config;
  std::ifstream file(path);
  if (!file.is_open()) {
    CHIP_LOG(error, "Config", "Cannot open %s, using defaults", path.c_str());
    return config;
  }

  std::string body((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    CHIP_LOG(error, "Config", "%s is not a JSON object, using defaults",
             path.c_str());
    return config;
  }

  try {
    config.port = j.value("port", config.port);
    config.uploadDir = j.value("uploadDir", config.uploadDir);
    config.catalogPath = j.value("catalogPath", config.catalogPath);
    config.indexPath = j.value("indexPath", config.indexPath);
    config.chunkSize = j.value("chunkSize", config.chunkSize);
    config.maxUploadBytes = j.value("maxUploadBytes", config.maxUploadBytes);
    config.numThreads = j.value("numThreads", config.numThreads);
    config.requestTimeoutMs = j.value("requestTimeoutMs", config.requestTimeoutMs);
    config.logLevel = j.value("logLevel", config.logLevel);
  } catch (nlohmann::json::exception& e) {
    CHIP_LOG(error, "Config", "Invalid value in %s: %s, using defaults",
             path.c_str(), e.what());
    return ServerConfig();
  }

  if (config.chunkSize == 0) {
    config.chunkSize = 64 * 1024;
  }
  return config;
}

std::vector<std::pair<std::string, std::string>> ServerConfig::civetOptions()
    const {
  return {
      {"num_threads", std::to_string(numThreads)},
      {"request_timeout_ms", std::to_string(requestTimeoutMs)},
  };
}
