#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "dix/config/config.hpp"
#include "dix/di/container.hpp"
#include "dix/util/logging.hpp"
#include "test_helpers.hpp"

using namespace dix;
using namespace dix::config;
using namespace dix::test;

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, EmptyTextKeepsDefaults) {
  auto config = Config::parse("");

  ASSERT_OK(config);
  EXPECT_EQ(config->default_lifetime, di::Lifetime::kPerRequest);
  EXPECT_EQ(config->log_level, "warn");
  EXPECT_TRUE(config->log_pattern.empty());
}

TEST_F(ConfigTest, ParsesContainerAndLogging) {
  auto config = Config::parse(R"(
[container]
default_lifetime = "static"

[logging]
level = "debug"
pattern = "[%l] %v"
)");

  ASSERT_OK(config);
  EXPECT_EQ(config->default_lifetime, di::Lifetime::kStatic);
  EXPECT_EQ(config->log_level, "debug");
  EXPECT_EQ(config->log_pattern, "[%l] %v");
}

TEST_F(ConfigTest, RejectsUnknownLifetime) {
  auto config = Config::parse("[container]\ndefault_lifetime = \"forever\"\n");
  EXPECT_ERROR(config, ErrorCode::kConfigError);
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
  auto config = Config::parse("[logging]\nlevel = \"loud\"\n");
  EXPECT_ERROR(config, ErrorCode::kConfigError);
}

TEST_F(ConfigTest, RejectsNonStringValues) {
  EXPECT_ERROR(Config::parse("[container]\ndefault_lifetime = 1\n"), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::parse("[logging]\nlevel = true\n"), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::parse("[logging]\npattern = [\"%v\"]\n"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, RejectsMalformedToml) {
  auto config = Config::parse("[container\ndefault_lifetime = ");
  EXPECT_ERROR(config, ErrorCode::kParseError);
}

TEST_F(ConfigTest, MissingFile) {
  auto config = Config::load(temp_dir_ / "missing.toml");
  EXPECT_ERROR(config, ErrorCode::kFileNotFound);
}

TEST_F(ConfigTest, LoadsFromFile) {
  auto path = writeFile(temp_dir_, "dix.toml", "[container]\ndefault_lifetime = \"static\"\n");

  auto config = Config::load(path);

  ASSERT_OK(config);
  EXPECT_EQ(config->default_lifetime, di::Lifetime::kStatic);
}

TEST_F(ConfigTest, SaveThenLoad) {
  Config original;
  original.default_lifetime = di::Lifetime::kStatic;
  original.log_level = "info";
  original.log_pattern = "%v";

  auto path = temp_dir_ / "saved.toml";
  ASSERT_OK(original.save(path));

  auto loaded = Config::load(path);
  ASSERT_OK(loaded);
  EXPECT_EQ(loaded->default_lifetime, di::Lifetime::kStatic);
  EXPECT_EQ(loaded->log_level, "info");
  EXPECT_EQ(loaded->log_pattern, "%v");
}

TEST(LifetimeTest, StringConversion) {
  EXPECT_EQ(di::lifetimeToString(di::Lifetime::kStatic), "static");
  EXPECT_EQ(di::lifetimeToString(di::Lifetime::kPerRequest), "per_request");

  auto lifetime = stringToLifetime("per_request");
  ASSERT_OK(lifetime);
  EXPECT_EQ(*lifetime, di::Lifetime::kPerRequest);
  EXPECT_ERROR(stringToLifetime("Static"), ErrorCode::kConfigError);
}

TEST(ContainerConfigTest, DefaultLifetimeFromConfig) {
  Config config;
  config.default_lifetime = di::Lifetime::kStatic;
  auto container = di::Container::fromConfig(config);

  int calls = 0;
  container.registerDynamic<Counter>([&calls](di::Resolver&) -> Result<Counter> {
    return Counter{++calls};
  });

  ASSERT_OK(container.resolve<Counter>());
  auto second = container.resolve<Counter>();
  ASSERT_OK(second);
  EXPECT_EQ(second->value, 1);
  EXPECT_EQ(calls, 1);
}

TEST(LoggingConfigTest, ParsesLevelNames) {
  auto debug = util::parseLogLevel("debug");
  ASSERT_OK(debug);
  EXPECT_EQ(*debug, spdlog::level::debug);

  auto off = util::parseLogLevel("off");
  ASSERT_OK(off);
  EXPECT_EQ(*off, spdlog::level::off);

  EXPECT_ERROR(util::parseLogLevel("verbose"), ErrorCode::kConfigError);
}

TEST(LoggingConfigTest, ConfigureLoggingSetsLevel) {
  Config config;
  config.log_level = "debug";

  ASSERT_OK(util::configureLogging(config));
  EXPECT_EQ(util::logger()->level(), spdlog::level::debug);

  config.log_level = "warn";
  ASSERT_OK(util::configureLogging(config));
  EXPECT_EQ(util::logger()->level(), spdlog::level::warn);
}

TEST(LoggingConfigTest, SharedLoggerIsRegistered) {
  auto log = util::logger();
  EXPECT_EQ(log->name(), util::kLoggerName);
  EXPECT_EQ(spdlog::get(util::kLoggerName), log);
}
