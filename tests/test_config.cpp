/**
 * @file test_config.cpp
 * @brief Tests for config::Loader defaults and environment overrides.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <string>

#include "kprim/config/config_loader.hpp"
#include "kprim/config/constants.hpp"
#include "kprim/obs/observability.hpp"
#include "kprim/version.hpp"

using kprim::config::Loader;
namespace C = kprim::config::constants;

namespace {
struct EnvGuard {
  explicit EnvGuard(const char* name) : name_(name) {}
  ~EnvGuard() { ::unsetenv(name_); }
  void set(const char* value) const { ::setenv(name_, value, 1); }
  const char* name_;
};
} // namespace

TEST(Config, Defaults) {
  const auto rc = Loader::defaults();
  EXPECT_EQ(rc.copy_buffer_bytes, C::COPY_BUFFER_BYTES);
  EXPECT_EQ(rc.log_level, spdlog::level::warn);
}

TEST(Config, ParseBytes) {
  EXPECT_EQ(Loader::parse_bytes("65536"), std::optional<std::size_t>(65536));
  EXPECT_FALSE(Loader::parse_bytes("").has_value());
  EXPECT_FALSE(Loader::parse_bytes("0").has_value());
  EXPECT_FALSE(Loader::parse_bytes("12k").has_value());
  EXPECT_FALSE(Loader::parse_bytes("-1").has_value());
}

TEST(Config, ParseLevel) {
  EXPECT_EQ(Loader::parse_level("debug"), std::optional(spdlog::level::debug));
  EXPECT_EQ(Loader::parse_level("off"), std::optional(spdlog::level::off));
  EXPECT_FALSE(Loader::parse_level("loud").has_value());
}

TEST(Config, EnvOverridesAndClamps) {
  EnvGuard bytes(C::ENV_COPY_BUFFER_BYTES);
  EnvGuard level(C::ENV_LOG_LEVEL);

  bytes.set("131072");
  level.set("info");
  auto rc = Loader::load_from_env();
  EXPECT_EQ(rc.copy_buffer_bytes, 131072u);
  EXPECT_EQ(rc.log_level, spdlog::level::info);

  bytes.set("1");
  EXPECT_EQ(Loader::load_from_env().copy_buffer_bytes, C::COPY_BUFFER_MIN_BYTES);

  bytes.set("999999999999");
  EXPECT_EQ(Loader::load_from_env().copy_buffer_bytes, C::COPY_BUFFER_MAX_BYTES);

  bytes.set("garbage");
  level.set("garbage");
  rc = Loader::load_from_env();
  EXPECT_EQ(rc.copy_buffer_bytes, C::COPY_BUFFER_BYTES);
  EXPECT_EQ(rc.log_level, spdlog::level::warn);
}

TEST(Logger, SharedNamedLogger) {
  auto a = kprim::obs::logger();
  auto b = kprim::obs::logger();
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a, b);
  EXPECT_EQ(a->name(), C::LOGGER_NAME);
  EXPECT_EQ(a->level(), kprim::config::current().log_level);
}

TEST(Version, StringMatchesComponents) {
  const std::string expected = std::to_string(kprim::version_major) + "." +
                               std::to_string(kprim::version_minor) + "." +
                               std::to_string(kprim::version_patch);
  EXPECT_EQ(expected, kprim::version_string);
}
