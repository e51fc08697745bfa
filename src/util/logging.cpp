#include "dix/util/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "dix/config/config.hpp"

namespace dix::util {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;

  std::call_once(once, [] {
    instance = spdlog::get(kLoggerName);
    if (instance) {
      return;
    }
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    instance = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
    instance->set_pattern(kDefaultLogPattern);
    instance->set_level(spdlog::level::warn);
    spdlog::register_logger(instance);
  });
  return instance;
}

Result<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
  // from_str maps unknown names to "off", so "off" has to be recognized first
  if (name == "off") {
    return spdlog::level::off;
  }
  auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off) {
    return makeErrorResult<spdlog::level::level_enum>(
        ErrorCode::kConfigError, fmt::format("unknown log level '{}'", name));
  }
  return level;
}

Result<void> configureLogging(const config::Config& config) {
  auto level = parseLogLevel(config.log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  auto log = logger();
  log->set_level(*level);
  log->set_pattern(config.log_pattern.empty() ? std::string(kDefaultLogPattern)
                                              : config.log_pattern);
  log->debug("Logging configured (level={})", config.log_level);
  return {};
}

}  // namespace dix::util
