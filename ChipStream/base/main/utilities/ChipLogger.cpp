#include "ChipLogger.h"

#include <stdio.h>  // for printf, vprintf, fflush
#include <time.h>   // for gmtime_r, localtime_r, strftime
#include <chrono>   // for system_clock

// Single global lock for logging across the whole program
static std::mutex logMutex;

chipstream::AbstractLogger* chipstream::chipGlobalLogger = nullptr;

namespace {
const char* colorReset = "\033[0m";
const char* colorRed = "\033[0;31m";
const char* colorBlue = "\033[0;34m";
const char* colorGrey = "\033[0;90m";
const int allColors[] = {32, 33, 34, 35, 36, 92, 93, 94, 95, 96};
const int numColors = sizeof(allColors) / sizeof(allColors[0]);
}  // namespace

void chipstream::ChipLogger::debug(std::string filename, int line,
                                   std::string submodule, const char* format,
                                   ...) {
  va_list args;
  va_start(args, format);
  write(LogLevel::Debug, filename, line, submodule, format, args);
  va_end(args);
}

void chipstream::ChipLogger::info(std::string filename, int line,
                                  std::string submodule, const char* format,
                                  ...) {
  va_list args;
  va_start(args, format);
  write(LogLevel::Info, filename, line, submodule, format, args);
  va_end(args);
}

void chipstream::ChipLogger::error(std::string filename, int line,
                                   std::string submodule, const char* format,
                                   ...) {
  va_list args;
  va_start(args, format);
  write(LogLevel::Error, filename, line, submodule, format, args);
  va_end(args);
}

void chipstream::ChipLogger::write(LogLevel level, const std::string& filename,
                                   int line, const std::string& submodule,
                                   const char* format, va_list args) {
  if (!enabled(level)) {
    return;
  }

  std::lock_guard<std::mutex> lock(logMutex);
  switch (level) {
    case LogLevel::Debug:
      printf("%s", colorGrey);
      break;
    case LogLevel::Info:
      printf("%s", colorBlue);
      break;
    case LogLevel::Error:
      printf("%s", colorRed);
      break;
  }
  printTimestamp();
  printf("%s", level == LogLevel::Debug  ? "D "
               : level == LogLevel::Info ? "I "
                                         : "E ");
  printFilename(filename);
  printf(":%d: ", line);
  if (enableSubmodule && !submodule.empty()) {
    printf("[%s] ", submodule.c_str());
  }
  printf("%s", colorReset);
  vprintf(format, args);
  printf("\n");
  fflush(stdout);
}

void chipstream::ChipLogger::printTimestamp() {
  if (!enableTimestamp) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;

  struct tm parts;
  if (shortTime) {
    localtime_r(&seconds, &parts);
  } else {
    gmtime_r(&seconds, &parts);
  }
  char buffer[32];
  strftime(buffer, sizeof(buffer), shortTime ? "%H:%M:%S" : "%Y-%m-%d %H:%M:%S",
           &parts);
  printf("[%s.%03d] ", buffer, (int)millis);
}

void chipstream::ChipLogger::printFilename(const std::string& filename) {
  std::string basenameStr(filename.substr(filename.rfind('/') + 1));

  unsigned long hash = 5381;
  for (char const& c : basenameStr) {
    hash = ((hash << 5) + hash) + (unsigned char)c;
  }

  printf("\033[1;%dm%s%s", allColors[hash % numColors], basenameStr.c_str(),
         colorReset);
}

void chipstream::setDefaultLogger() {
  static std::once_flag created;
  std::call_once(created, [] {
    if (chipGlobalLogger == nullptr) {
      chipGlobalLogger = new ChipLogger();
    }
  });
}

chipstream::AbstractLogger* chipstream::defaultLogger() {
  setDefaultLogger();
  return chipGlobalLogger;
}

void chipstream::enableSubmoduleLogging() {
  auto logger = defaultLogger();
  std::lock_guard<std::mutex> lock(logMutex);
  logger->enableSubmodule = true;
}

void chipstream::enableTimestampLogging(bool local) {
  auto logger = defaultLogger();
  std::lock_guard<std::mutex> lock(logMutex);
  logger->enableTimestamp = true;
  logger->shortTime = local;
}

void chipstream::setLogLevel(LogLevel level) {
  auto logger = defaultLogger();
  std::lock_guard<std::mutex> lock(logMutex);
  logger->minLevel = level;
}

chipstream::LogLevel chipstream::parseLogLevel(const std::string& name) {
  if (name == "debug") {
    return LogLevel::Debug;
  }
  if (name == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}
