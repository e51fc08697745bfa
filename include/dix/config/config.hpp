#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "dix/common.hpp"
#include "dix/di/registration.hpp"

namespace dix::config {

// Container and logging settings, read from TOML:
//
//   [container]
//   default_lifetime = "static"   # or "per_request"
//
//   [logging]
//   level = "debug"
//   pattern = "[%l] %v"
//
// The file only tunes defaults; it never declares registrations.
class Config {
 public:
  // Lifetime applied to registrations that do not choose their own
  di::Lifetime default_lifetime = di::Lifetime::kPerRequest;

  // spdlog level name for the "dix" logger
  std::string log_level = "warn";

  // spdlog pattern; empty keeps the default
  std::string log_pattern;

  // Load from a TOML file
  static Result<Config> load(const std::filesystem::path& config_path);

  // Parse TOML text; missing keys keep their defaults
  static Result<Config> parse(std::string_view toml_text);

  // Write as TOML
  Result<void> save(const std::filesystem::path& config_path) const;

  std::string toToml() const;

  // Default registration options for a container built from this config
  di::RegistrationOptionList defaultOptions() const;
};

Result<di::Lifetime> stringToLifetime(std::string_view value);

}  // namespace dix::config
