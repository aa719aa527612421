#include <gtest/gtest.h>
#include "reader/retry_policy.hpp"
#include "test_utils.hpp"

using namespace chunkvault;
using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
  reader::RetryPolicy policy;
  std::vector<std::chrono::milliseconds> delays;

  void SetUp() override {
    init_logging(boost::log::trivial::error);
    policy.sleeper = [this](std::chrono::milliseconds delay) { delays.push_back(delay); };
  }
};

TEST_F(RetryPolicyTest, DefaultsToThreeAttemptsOneSecondApart) {
  reader::RetryPolicy defaults;
  EXPECT_EQ(defaults.max_attempts, 3);
  EXPECT_EQ(defaults.base_delay, 1000ms);
  EXPECT_EQ(defaults.delay_after(1), 1000ms);
  EXPECT_EQ(defaults.delay_after(2), 2000ms);
  EXPECT_EQ(defaults.delay_after(3), 3000ms);
}

TEST_F(RetryPolicyTest, SucceedsWithoutRetry) {
  int calls = 0;
  int result = policy.run(0, "resolve", [&]() { ++calls; return 42; });

  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(delays.empty());
}

TEST_F(RetryPolicyTest, FailsTwiceThenSucceeds) {
  int calls = 0;
  std::string result = policy.run(4, "resolve and open", [&]() {
    if (++calls < 3) {
      throw core::ResolutionError("listing returned 503");
    }
    return std::string("location");
  });

  EXPECT_EQ(result, "location");
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(delays.size(), 2u);
  EXPECT_EQ(delays[0], 1000ms);
  EXPECT_EQ(delays[1], 2000ms);
}

TEST_F(RetryPolicyTest, GivesUpAfterExactlyThreeAttempts) {
  int calls = 0;
  try {
    policy.run(7, "resolve and open", [&]() -> int {
      ++calls;
      throw core::TransferError("status 500");
    });
    FAIL() << "Expected RetryExhaustedError";
  } catch (const core::RetryExhaustedError& e) {
    EXPECT_EQ(e.chunk_index(), 7);
    EXPECT_EQ(e.attempts(), 3);
    const std::string message = e.what();
    EXPECT_NE(message.find("Chunk 7"), std::string::npos);
    EXPECT_NE(message.find("3 attempts"), std::string::npos);
    EXPECT_NE(message.find("status 500"), std::string::npos);
  }

  EXPECT_EQ(calls, 3);
  EXPECT_EQ(delays.size(), 2u);
}

TEST_F(RetryPolicyTest, FatalErrorsAreNotRetried) {
  int calls = 0;
  EXPECT_THROW(policy.run(0, "resolve", [&]() -> int {
    ++calls;
    throw core::ChunkMissingError("empty listing");
  }), core::ChunkMissingError);

  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(delays.empty());
}

TEST_F(RetryPolicyTest, HonorsConfiguredAttempts) {
  policy.max_attempts = 5;
  policy.base_delay = 10ms;

  int calls = 0;
  EXPECT_THROW(policy.run(0, "open", [&]() -> int {
    ++calls;
    throw core::TransferError("reset");
  }), core::RetryExhaustedError);

  EXPECT_EQ(calls, 5);
  ASSERT_EQ(delays.size(), 4u);
  EXPECT_EQ(delays[3], 40ms);
}

TEST_F(RetryPolicyTest, RejectsZeroAttempts) {
  policy.max_attempts = 0;
  EXPECT_THROW(policy.run(0, "open", []() { return 1; }), core::ConfigurationError);
}
