#include <gtest/gtest.h>

#include "client/reconnect.hpp"

namespace {
using namespace std::chrono_literals;
}  // namespace

TEST(ReconnectBackoffTest, DoublesUntilCap) {
  client::BackoffConfig config{1000ms, 30000ms, 0.0};
  client::ReconnectBackoff backoff(config, 1);
  EXPECT_EQ(backoff.NextDelay(), 1000ms);
  EXPECT_EQ(backoff.NextDelay(), 2000ms);
  EXPECT_EQ(backoff.NextDelay(), 4000ms);
  EXPECT_EQ(backoff.NextDelay(), 8000ms);
  EXPECT_EQ(backoff.NextDelay(), 16000ms);
  EXPECT_EQ(backoff.NextDelay(), 30000ms);
  EXPECT_EQ(backoff.NextDelay(), 30000ms);
  EXPECT_EQ(backoff.Attempts(), 7u);
}

TEST(ReconnectBackoffTest, ResetStartsOver) {
  client::ReconnectBackoff backoff({1000ms, 30000ms, 0.0}, 1);
  backoff.NextDelay();
  backoff.NextDelay();
  backoff.Reset();
  EXPECT_EQ(backoff.Attempts(), 0u);
  EXPECT_EQ(backoff.NextDelay(), 1000ms);
}

TEST(ReconnectBackoffTest, JitterStaysWithinBounds) {
  client::BackoffConfig config{1000ms, 30000ms, 0.2};
  for (std::uint32_t seed = 0; seed < 50; ++seed) {
    client::ReconnectBackoff backoff(config, seed);
    auto first = backoff.NextDelay();
    auto second = backoff.NextDelay();
    EXPECT_GE(first, 800ms);
    EXPECT_LE(first, 1200ms);
    EXPECT_GE(second, 1600ms);
    EXPECT_LE(second, 2400ms);
  }
}

TEST(ReconnectBackoffTest, JitterNeverExceedsCap) {
  client::ReconnectBackoff backoff({1000ms, 5000ms, 0.5}, 3);
  for (int i = 0; i < 20; ++i) {
    EXPECT_LE(backoff.NextDelay(), 5000ms);
  }
}

TEST(ReconnectBackoffTest, NominalDelayHandlesLargeAttempts) {
  client::BackoffConfig config{1000ms, 30000ms, 0.2};
  EXPECT_EQ(client::ReconnectBackoff::NominalDelay(config, 0), 1000ms);
  EXPECT_EQ(client::ReconnectBackoff::NominalDelay(config, 1), 2000ms);
  EXPECT_EQ(client::ReconnectBackoff::NominalDelay(config, 1000), 30000ms);
}
