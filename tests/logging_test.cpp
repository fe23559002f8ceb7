#include <archlens/logging.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace archlens {
namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  StructuredLogger logger(stream, {LogLevel::kInfo});

  logger.Log(LogLevel::kDebug, "debug message", {});
  logger.Log(LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  StructuredLogger logger(stream, {LogLevel::kDebug});

  logger.Log(LogLevel::kDebug, "pipeline.stage.complete",
             {{"stage", "extract"}, {"edges", "42"}});

  const auto output = stream.str();
  EXPECT_THAT(output, ::testing::HasSubstr("fields={\"stage\": \"extract\""));
  EXPECT_THAT(output, ::testing::HasSubstr("\"edges\": \"42\"}"));
  EXPECT_THAT(output,
              ::testing::HasSubstr("message=\"pipeline.stage.complete\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<NullLogger>(provided));

  auto custom = std::make_shared<StructuredLogger>(std::cout, LoggingConfig{});
  EXPECT_EQ(custom, EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
  EXPECT_EQ(ParseLogLevel(" warning "), LogLevel::kWarn);
  EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
  EXPECT_EQ(LogLevelName(LogLevel::kInfo), "info");
  EXPECT_THROW(ParseLogLevel("loud"), std::invalid_argument);
}

TEST(LoggingTest, ConcurrentWritersProduceWholeLines) {
  std::stringstream stream;
  StructuredLogger logger(stream, {LogLevel::kInfo});

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&logger, t]() {
      for (int i = 0; i < 50; ++i) {
        logger.Log(LogLevel::kInfo, "worker",
                   {{"thread", std::to_string(t)}});
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  std::string line;
  int lines = 0;
  while (std::getline(stream, line)) {
    EXPECT_THAT(line, ::testing::StartsWith("["));
    EXPECT_THAT(line, ::testing::EndsWith("\"}"));
    ++lines;
  }
  EXPECT_EQ(lines, 200);
}

} // namespace
} // namespace archlens
