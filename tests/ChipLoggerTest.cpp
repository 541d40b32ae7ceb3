#include <gtest/gtest.h>

#include <string>

#include "ChipLogger.h"

using namespace chipstream;

class ChipLoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    savedSubmodule = defaultLogger()->enableSubmodule;
    savedLevel = defaultLogger()->minLevel;
  }

  void TearDown() override {
    defaultLogger()->enableSubmodule = savedSubmodule;
    setLogLevel(savedLevel);
  }

  bool savedSubmodule = false;
  LogLevel savedLevel = LogLevel::Info;
};

TEST_F(ChipLoggerTest, SubmoduleTagIsPrintedWhenEnabled) {
  enableSubmoduleLogging();
  setLogLevel(LogLevel::Info);

  testing::internal::CaptureStdout();
  CHIP_LOG(info, "Catalog", "loaded %d songs", 3);
  std::string out = testing::internal::GetCapturedStdout();

  EXPECT_NE(out.find("[Catalog] "), std::string::npos);
  EXPECT_NE(out.find("loaded 3 songs"), std::string::npos);
}

TEST_F(ChipLoggerTest, LevelFilter) {
  setLogLevel(LogLevel::Error);

  testing::internal::CaptureStdout();
  CHIP_LOG(info, "SongService", "hidden");
  CHIP_LOG(error, "SongService", "shown");
  std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ(out.find("hidden"), std::string::npos);
  EXPECT_NE(out.find("shown"), std::string::npos);
}

TEST(ChipLoggerLevelTest, ParseLogLevel) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
  EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
  EXPECT_EQ(parseLogLevel("verbose"), LogLevel::Info);
}
