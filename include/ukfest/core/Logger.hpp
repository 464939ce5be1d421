#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace ukfest {

struct FileSinkConfig_t {
  bool enabled = false;
  std::string path = "logs/ukfest.log";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

struct ClassSinkConfig_t {
  bool enabled = false;
  std::string directory = "logs/classes";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

// Complete logging setup applied in one call by applications.
struct LoggingConfig_t {
  bool enabled = true;
  spdlog::level::level_enum level = spdlog::level::info;
  FileSinkConfig_t file;
  ClassSinkConfig_t classLogs;
};

// Process-wide spdlog front end. Safe to call from model worker threads.
class Logger {
 public:
  static void Initialize();
  static void Configure(const LoggingConfig_t& config);
  static std::shared_ptr<spdlog::logger> Get();
  // Per-class logger "ukfest.<name>" writing to <directory>/<name>.log, or the process logger
  // when class logs are disabled or the file cannot be opened.
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  static void SetLevel(spdlog::level::level_enum level);
  static void Flush();
  // Case-insensitive spdlog level name; "warning" is accepted and unknown names yield info.
  static spdlog::level::level_enum ParseLevel(const std::string& value);
};

} // namespace ukfest
