#include "shepherd/status.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace shepherd {

TEST(StatusTest, ExitedSuccess) {
  auto status = ExitStatus::exited(0);
  EXPECT_TRUE(status.success());
  ASSERT_TRUE(status.code().has_value());
  EXPECT_EQ(status.code().value(), 0);
  EXPECT_FALSE(status.signal().has_value());
  EXPECT_EQ(status.effective_code(), 0);
}

TEST(StatusTest, ExitedFailureKeepsCode) {
  auto status = ExitStatus::exited(3);
  EXPECT_FALSE(status.success());
  EXPECT_EQ(status.kind(), ExitStatus::Kind::exited);
  EXPECT_EQ(status.effective_code(), 3);
}

TEST(StatusTest, SignaledUsesShellConvention) {
  auto status = ExitStatus::signaled(SIGKILL);
  EXPECT_FALSE(status.success());
  EXPECT_FALSE(status.code().has_value());
  ASSERT_TRUE(status.signal().has_value());
  EXPECT_EQ(*status.signal(), SIGKILL);
  EXPECT_EQ(status.effective_code(), ExitStatus::kSignalExitBase + SIGKILL);
}

}  // namespace shepherd
