#include "dix/config/config.hpp"

#include <fstream>
#include <optional>
#include <sstream>

#include <toml++/toml.hpp>

#include "dix/util/logging.hpp"

namespace dix::config {

namespace {

// A present key must hold a string; an absent key yields nullopt
Result<std::optional<std::string>> stringValue(const toml::table& config_data,
                                               std::string_view section, std::string_view key) {
  auto node = config_data[section][key];
  if (!node) {
    return std::optional<std::string>();
  }
  if (!node.is_string()) {
    return makeErrorResult<std::optional<std::string>>(
        ErrorCode::kConfigError,
        "'" + std::string(section) + "." + std::string(key) + "' must be a string");
  }
  return std::optional<std::string>(node.value<std::string>());
}

Result<Config> fromTable(const toml::table& config_data) {
  Config config;

  // Container defaults
  auto lifetime_name = stringValue(config_data, "container", "default_lifetime");
  if (!lifetime_name.has_value()) {
    return std::unexpected(lifetime_name.error());
  }
  if (*lifetime_name) {
    auto lifetime = stringToLifetime(**lifetime_name);
    if (!lifetime.has_value()) {
      return std::unexpected(lifetime.error());
    }
    config.default_lifetime = *lifetime;
  }

  // Logging
  auto level_name = stringValue(config_data, "logging", "level");
  if (!level_name.has_value()) {
    return std::unexpected(level_name.error());
  }
  if (*level_name) {
    auto level = util::parseLogLevel(**level_name);
    if (!level.has_value()) {
      return std::unexpected(level.error());
    }
    config.log_level = **level_name;
  }

  auto pattern = stringValue(config_data, "logging", "pattern");
  if (!pattern.has_value()) {
    return std::unexpected(pattern.error());
  }
  if (*pattern) {
    config.log_pattern = **pattern;
  }

  return config;
}

}  // namespace

Result<di::Lifetime> stringToLifetime(std::string_view value) {
  if (value == "static") {
    return di::Lifetime::kStatic;
  }
  if (value == "per_request") {
    return di::Lifetime::kPerRequest;
  }
  return makeErrorResult<di::Lifetime>(
      ErrorCode::kConfigError,
      "unknown lifetime '" + std::string(value) + "' (expected 'static' or 'per_request')");
}

Result<Config> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return makeErrorResult<Config>(ErrorCode::kFileNotFound,
                                   "Config file not found: " + config_path.string());
  }

  try {
    auto config_data = toml::parse_file(config_path.string());
    return fromTable(config_data);
  } catch (const toml::parse_error& e) {
    return makeErrorResult<Config>(ErrorCode::kParseError,
                                   "TOML parse error: " + std::string(e.what()));
  }
}

Result<Config> Config::parse(std::string_view toml_text) {
  try {
    auto config_data = toml::parse(toml_text);
    return fromTable(config_data);
  } catch (const toml::parse_error& e) {
    return makeErrorResult<Config>(ErrorCode::kParseError,
                                   "TOML parse error: " + std::string(e.what()));
  }
}

std::string Config::toToml() const {
  toml::table logging_table{{"level", log_level}};
  if (!log_pattern.empty()) {
    logging_table.insert("pattern", log_pattern);
  }

  toml::table config_data{
      {"container",
       toml::table{{"default_lifetime", std::string(di::lifetimeToString(default_lifetime))}}},
      {"logging", std::move(logging_table)}};

  std::ostringstream oss;
  oss << config_data;
  return oss.str();
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::ofstream file(config_path);
  if (!file) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "Cannot write config file: " + config_path.string());
  }
  file << toToml() << '\n';
  if (!file) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "Failed writing config file: " + config_path.string());
  }
  return {};
}

di::RegistrationOptionList Config::defaultOptions() const {
  return {di::withLifetime(default_lifetime)};
}

}  // namespace dix::config
