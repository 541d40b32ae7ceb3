#pragma once

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t
#include <string>    // for string
#include <utility>   // for pair
#include <vector>    // for vector

namespace chipstream {

struct ServerConfig {
  int port = 8080;
  std::string uploadDir = "uploads";
  std::string catalogPath = "songs.json";
  std::string indexPath = "index.html";
  size_t chunkSize = 64 * 1024;
  uint64_t maxUploadBytes = 512ull * 1024 * 1024;
  int numThreads = 8;
  int requestTimeoutMs = 30000;
  std::string logLevel = "info";

  /**
   * Reads a JSON object with the same keys. Missing keys keep their
   * defaults, unknown keys are ignored. An unreadable or malformed file
   * yields the defaults and an error line in the log.
   */
  static ServerConfig load(const std::string& path);

  // listening_ports is added by HTTPServer itself.
  std::vector<std::pair<std::string, std::string>> civetOptions() const;
};

}  // namespace chipstream
