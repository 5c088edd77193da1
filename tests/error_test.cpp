#include "labrun/core/error.hpp"

#include <gtest/gtest.h>

using namespace labrun;

TEST(ErrorTest, CategoryName) {
  EXPECT_STREQ(error_category().name(), "labrun");
}

TEST(ErrorTest, MessagesMatchEnum) {
  EXPECT_EQ(make_error_code(Error::Success).message(), "success");
  EXPECT_EQ(make_error_code(Error::InvalidArtifact).message(),
            "invalid submission artifact");
  EXPECT_EQ(make_error_code(Error::EngineCommandFailed).message(),
            "container engine command failed");
  EXPECT_EQ(make_error_code(Error::UnknownContainerStatus).message(),
            "unknown container status");
  EXPECT_EQ(make_error_code(Error::NetworkNotIsolated).message(),
            "network does not isolate containers");
}

TEST(ErrorTest, OutOfRangeValueIsUnknown) {
  std::error_code ec{999, error_category()};
  EXPECT_EQ(ec.message(), "unknown error");
}

TEST(ErrorTest, ErrorEnumComparesWithErrorCode) {
  std::error_code ec = Error::ParseError;
  EXPECT_EQ(ec, Error::ParseError);
  EXPECT_NE(ec, Error::FileNotFound);
}

TEST(ErrorTest, OkAndFail) {
  Result<int> good = ok(5);
  ASSERT_TRUE(good.has_value());
  EXPECT_EQ(*good, 5);

  Result<int> bad = fail(Error::SpawnFailed);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), Error::SpawnFailed);

  Result<void> done = ok();
  EXPECT_TRUE(done.has_value());
}
