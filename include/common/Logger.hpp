#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace zonekeeper::common {

/// Thin wrapper over spdlog.
/// Uses spdlog's default logger to avoid static destruction order issues.
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Record {} saved in zone {}", sName, iZoneId);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Returns spdlog's default logger, initializing at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace zonekeeper::common
