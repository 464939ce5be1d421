#include <filesystem>

#include <gtest/gtest.h>

#include "ukfest/core/Logger.hpp"

TEST(LoggerTests, ParsesLevelNames) {
  EXPECT_EQ(ukfest::Logger::ParseLevel("debug"), spdlog::level::debug);
  EXPECT_EQ(ukfest::Logger::ParseLevel("WARNING"), spdlog::level::warn);
  EXPECT_EQ(ukfest::Logger::ParseLevel("error"), spdlog::level::err);
  EXPECT_EQ(ukfest::Logger::ParseLevel("off"), spdlog::level::off);
  EXPECT_EQ(ukfest::Logger::ParseLevel("loud"), spdlog::level::info);
}

TEST(LoggerTests, DisabledLoggingReturnsNoLogger) {
  ukfest::LoggingConfig_t config;
  config.enabled = false;
  ukfest::Logger::Configure(config);
  EXPECT_EQ(ukfest::Logger::Get(), nullptr);
  EXPECT_EQ(ukfest::Logger::GetClass("FilterEngine"), nullptr);

  ukfest::Logger::Configure(ukfest::LoggingConfig_t{});
  EXPECT_NE(ukfest::Logger::Get(), nullptr);
}

TEST(LoggerTests, ClassLoggersWriteSeparateFiles) {
  const std::filesystem::path directory = std::filesystem::temp_directory_path() / "ukfest_logger_tests";
  std::filesystem::remove_all(directory);

  ukfest::LoggingConfig_t config;
  config.level = spdlog::level::debug;
  config.classLogs.enabled = true;
  config.classLogs.directory = directory.string();
  ukfest::Logger::Configure(config);

  auto logger = ukfest::Logger::GetClass("Sequencer");
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "ukfest.Sequencer");
  EXPECT_EQ(ukfest::Logger::GetClass("Sequencer"), logger);
  logger->debug("class log line");
  ukfest::Logger::Flush();
  EXPECT_TRUE(std::filesystem::exists(directory / "Sequencer.log"));

  ukfest::Logger::SetLevel(spdlog::level::err);
  EXPECT_EQ(logger->level(), spdlog::level::err);

  ukfest::Logger::Configure(ukfest::LoggingConfig_t{});
  std::filesystem::remove_all(directory);
}
