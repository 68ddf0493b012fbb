/**
 * @file test_os.cpp
 * @brief Tests for the environment and user id collaborators.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <unordered_set>

#include <unistd.h>

#include "kprim/os/environment.hpp"
#include "kprim/os/error_code.hpp"
#include "kprim/os/user.hpp"

namespace env  = kprim::os::env;
namespace user = kprim::os::user;

TEST(UserId, ZeroIsRoot) {
  EXPECT_EQ(user::Id(0), user::Id::root());
  EXPECT_TRUE(user::Id(0).is_root());
  EXPECT_FALSE(user::Id(1000).is_root());
}

TEST(UserId, RawRoundTrip) {
  for (std::uint32_t v : {0u, 1u, 501u, 65534u, 0xFFFFFFFEu}) {
    EXPECT_EQ(user::Id(v).raw(), v);
  }
}

TEST(UserId, CurrentMatchesProcess) {
  EXPECT_EQ(user::current().raw(), static_cast<std::uint32_t>(::getuid()));
  EXPECT_EQ(user::effective().raw(), static_cast<std::uint32_t>(::geteuid()));
  std::unordered_set<user::Id> ids{user::current(), user::current()};
  EXPECT_EQ(ids.size(), 1u);
}

TEST(Environment, GetAndIsSet) {
  ::setenv("KPRIM_TEST_ENV_VALUE", "on", 1);
  ::unsetenv("KPRIM_TEST_ENV_ABSENT");

  EXPECT_EQ(env::get("KPRIM_TEST_ENV_VALUE"), std::optional<std::string>("on"));
  EXPECT_TRUE(env::is_set("KPRIM_TEST_ENV_VALUE"));
  EXPECT_TRUE(env::is_set("KPRIM_TEST_ENV_VALUE", "on"));
  EXPECT_FALSE(env::is_set("KPRIM_TEST_ENV_VALUE", "off"));

  EXPECT_FALSE(env::get("KPRIM_TEST_ENV_ABSENT").has_value());
  EXPECT_FALSE(env::is_set("KPRIM_TEST_ENV_ABSENT"));
  ::unsetenv("KPRIM_TEST_ENV_VALUE");
}

TEST(ErrorCode, DomainsAndFormatting) {
  const auto p = kprim::os::ErrorCode::posix(2);
  const auto w = kprim::os::ErrorCode::win32(2);
  EXPECT_NE(p, w);
  EXPECT_EQ(p.posix_value(), 2);
  EXPECT_EQ(w.posix_value(), -1);
  EXPECT_EQ(p.to_string(), "posix(2)");
  EXPECT_EQ(w.to_string(), "win32(2)");
}
