#pragma once

#include <stdarg.h>  // for va_list
#include <mutex>     // for mutex
#include <string>    // for string

namespace chipstream {

enum class LogLevel { Debug = 0, Info = 1, Error = 2 };

class AbstractLogger {
 public:
  bool enableSubmodule = false;
  bool enableTimestamp = false;
  bool shortTime = false;
  LogLevel minLevel = LogLevel::Info;

  virtual ~AbstractLogger() {}

  virtual void debug(std::string filename, int line, std::string submodule,
                     const char* format, ...) = 0;
  virtual void info(std::string filename, int line, std::string submodule,
                    const char* format, ...) = 0;
  virtual void error(std::string filename, int line, std::string submodule,
                     const char* format, ...) = 0;

  bool enabled(LogLevel level) const { return level >= minLevel; }
};

extern AbstractLogger* chipGlobalLogger;

// Colored console logger, one line per call.
class ChipLogger : public AbstractLogger {
 public:
  void debug(std::string filename, int line, std::string submodule,
             const char* format, ...) override;
  void info(std::string filename, int line, std::string submodule,
            const char* format, ...) override;
  void error(std::string filename, int line, std::string submodule,
             const char* format, ...) override;

 private:
  void write(LogLevel level, const std::string& filename, int line,
             const std::string& submodule, const char* format, va_list args);
  void printTimestamp();
  void printFilename(const std::string& filename);
};

void setDefaultLogger();
AbstractLogger* defaultLogger();
void enableSubmoduleLogging();
void enableTimestampLogging(bool local = false);
void setLogLevel(LogLevel level);

// "debug", "info" or "error"; anything else maps to Info.
LogLevel parseLogLevel(const std::string& name);

}  // namespace chipstream

#define CHIP_LOG(type, ...)                                             \
  do {                                                                  \
    chipstream::defaultLogger()->type(__FILE__, __LINE__, __VA_ARGS__); \
  } while (0)
