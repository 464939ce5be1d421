#include "ukfest/core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ukfest {

namespace {

constexpr const char* kProcessLoggerName = "ukfest";
// Thread id distinguishes model workers inside a tick.
constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] [%n] [t%t] %v";

struct LoggerState_t {
  std::recursive_mutex mutex;
  LoggingConfig_t config;
  std::shared_ptr<spdlog::logger> process;
  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> classes;
};

LoggerState_t& state() {
  static LoggerState_t instance;
  return instance;
}

std::string classLoggerName(const std::string& name) {
  return std::string(kProcessLoggerName) + "." + name;
}

std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> openRotatingSink(const std::filesystem::path& path,
                                                                       std::size_t maxSizeBytes,
                                                                       std::size_t maxFiles) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), maxSizeBytes, maxFiles);
}

void dropClassLoggers(LoggerState_t& s) {
  for (const auto& entry : s.classes) {
    spdlog::drop(entry.second->name());
  }
  s.classes.clear();
}

void rebuildProcessLogger(LoggerState_t& s) {
  dropClassLoggers(s);
  spdlog::drop(kProcessLoggerName);
  s.process.reset();
  if (!s.config.enabled) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (s.config.file.enabled) {
    try {
      sinks.push_back(openRotatingSink(s.config.file.path, s.config.file.maxSizeBytes, s.config.file.maxFiles));
    } catch (const spdlog::spdlog_ex& ex) {
      fmt::print(stderr, "ukfest: file log '{}' unavailable ({}), logging to stdout only\n", s.config.file.path, ex.what());
    }
  }

  s.process = std::make_shared<spdlog::logger>(kProcessLoggerName, sinks.begin(), sinks.end());
  s.process->set_pattern(kPattern);
  s.process->set_level(s.config.level);
  spdlog::register_logger(s.process);
}

std::shared_ptr<spdlog::logger> openClassLogger(LoggerState_t& s, const std::string& name) {
  const ClassSinkConfig_t& cfg = s.config.classLogs;
  const std::filesystem::path path = std::filesystem::path(cfg.directory) / (name + ".log");
  try {
    auto logger = std::make_shared<spdlog::logger>(classLoggerName(name),
                                                   openRotatingSink(path, cfg.maxSizeBytes, cfg.maxFiles));
    logger->set_pattern(kPattern);
    logger->set_level(s.config.level);
    spdlog::register_logger(logger);
    return logger;
  } catch (const spdlog::spdlog_ex& ex) {
    if (s.process) {
      s.process->warn("Class log '{}' unavailable: {}", path.string(), ex.what());
    }
    return nullptr;
  }
}

} // namespace

void Logger::Initialize() {
  LoggerState_t& s = state();
  std::lock_guard<std::recursive_mutex> lock(s.mutex);
  if (!s.process && s.config.enabled) {
    rebuildProcessLogger(s);
  }
}

void Logger::Configure(const LoggingConfig_t& config) {
  LoggerState_t& s = state();
  std::lock_guard<std::recursive_mutex> lock(s.mutex);
  s.config = config;
  rebuildProcessLogger(s);
}

std::shared_ptr<spdlog::logger> Logger::Get() {
  LoggerState_t& s = state();
  std::lock_guard<std::recursive_mutex> lock(s.mutex);
  if (!s.config.enabled) {
    return nullptr;
  }
  if (!s.process) {
    rebuildProcessLogger(s);
  }
  return s.process;
}

std::shared_ptr<spdlog::logger> Logger::GetClass(const std::string& name) {
  LoggerState_t& s = state();
  std::lock_guard<std::recursive_mutex> lock(s.mutex);
  if (!s.config.enabled || !s.config.classLogs.enabled) {
    return Get();
  }
  auto it = s.classes.find(name);
  if (it != s.classes.end()) {
    return it->second;
  }
  auto logger = openClassLogger(s, name);
  if (!logger) {
    return Get();
  }
  s.classes.emplace(name, logger);
  return logger;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  LoggerState_t& s = state();
  std::lock_guard<std::recursive_mutex> lock(s.mutex);
  s.config.level = level;
  if (s.process) {
    s.process->set_level(level);
  }
  for (auto& entry : s.classes) {
    entry.second->set_level(level);
  }
}

void Logger::Flush() {
  LoggerState_t& s = state();
  std::lock_guard<std::recursive_mutex> lock(s.mutex);
  if (s.process) {
    s.process->flush();
  }
  for (auto& entry : s.classes) {
    entry.second->flush();
  }
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "warning") {
    return spdlog::level::warn;
  }
  // from_str maps unknown names to off; unknown names fall back to info here.
  const spdlog::level::level_enum level = spdlog::level::from_str(lower);
  if (level == spdlog::level::off && lower != "off") {
    return spdlog::level::info;
  }
  return level;
}

} // namespace ukfest
