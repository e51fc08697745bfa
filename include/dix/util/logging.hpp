#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include "dix/common.hpp"

namespace dix::config {
class Config;
}  // namespace dix::config

namespace dix::util {

// Name of the library's spdlog logger
inline constexpr const char* kLoggerName = "dix";

// Default pattern, matching the rest of the application's logs
inline constexpr const char* kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

// Shared "dix" logger; created on first use with a stderr sink at warn level
std::shared_ptr<spdlog::logger> logger();

// Parse a level name ("trace" ... "critical", "off"); kConfigError if unknown
Result<spdlog::level::level_enum> parseLogLevel(std::string_view name);

// Apply level and pattern from the configuration
Result<void> configureLogging(const config::Config& config);

}  // namespace dix::util
