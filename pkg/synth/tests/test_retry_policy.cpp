// Repository: DialogCast
// Component: RetryPolicy unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "dialogcast/providers/RetryPolicy.hpp"
#include "dialogcast/util/Errors.hpp"

namespace dialogcast::providers {
namespace {

RetryConfig FastRetry(int attempts) {
  RetryConfig config;
  config.max_attempts = attempts;
  config.initial_backoff = std::chrono::milliseconds(1);
  config.max_backoff = std::chrono::milliseconds(4);
  return config;
}

HttpResponse Response(int status, const std::string& body = "") {
  HttpResponse r;
  r.status = status;
  r.body = body;
  return r;
}

TEST(RetryPolicyTest, SuccessOnFirstAttempt) {
  CancellationToken cancel;
  int calls = 0;
  const HttpResponse r = RetryPolicy(FastRetry(3)).Execute(
      "cartesia", 0, cancel, [&] { ++calls; return Response(200, "audio"); });
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(r.body, "audio");
}

TEST(RetryPolicyTest, TransientFailuresAreRetried) {
  CancellationToken cancel;
  int calls = 0;
  const HttpResponse r = RetryPolicy(FastRetry(3)).Execute(
      "elevenlabs", 2, cancel, [&] {
        ++calls;
        if (calls == 1) return Response(429, "rate limited");
        if (calls == 2) return HttpResponse{};  // No response
        return Response(200, "ok");
      });
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(r.status, 200);
}

TEST(RetryPolicyTest, ExhaustionEscalatesToSynthesisError) {
  CancellationToken cancel;
  int calls = 0;
  try {
    RetryPolicy(FastRetry(3)).Execute("cartesia", 4, cancel, [&] {
      ++calls;
      return Response(503, "busy");
    });
    FAIL() << "expected SynthesisError";
  } catch (const SynthesisError& e) {
    EXPECT_EQ(e.provider(), "cartesia");
    EXPECT_EQ(e.segment_index(), 4);
    EXPECT_NE(e.reason().find("gave up after 3 attempts"), std::string::npos);
  }
  EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, ClientErrorIsNotRetried) {
  CancellationToken cancel;
  int calls = 0;
  EXPECT_THROW(RetryPolicy(FastRetry(3)).Execute("elevenlabs", 0, cancel,
                                                 [&] {
                                                   ++calls;
                                                   return Response(401, "bad key");
                                                 }),
               SynthesisError);
  EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, CancelledTokenStopsBeforeFirstAttempt) {
  CancellationToken cancel;
  cancel.Cancel();
  int calls = 0;
  EXPECT_THROW(RetryPolicy(FastRetry(3)).Execute("cartesia", 0, cancel,
                                                 [&] {
                                                   ++calls;
                                                   return Response(200);
                                                 }),
               CancelledError);
  EXPECT_EQ(calls, 0);
}

TEST(RetryPolicyTest, CancelDuringBackoffWakesPromptly) {
  RetryConfig config;
  config.max_attempts = 3;
  config.initial_backoff = std::chrono::milliseconds(10000);
  config.max_backoff = std::chrono::milliseconds(10000);

  CancellationToken cancel;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.Cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(RetryPolicy(config).Execute("cartesia", 0, cancel,
                                           [] { return Response(500); }),
               CancelledError);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(RetryPolicyTest, BackoffDoublesUpToCap) {
  RetryConfig config;
  config.initial_backoff = std::chrono::milliseconds(2000);
  config.backoff_multiplier = 2.0;
  config.max_backoff = std::chrono::milliseconds(8000);
  const RetryPolicy policy(config);

  EXPECT_EQ(policy.BackoffAfter(1).count(), 2000);
  EXPECT_EQ(policy.BackoffAfter(2).count(), 4000);
  EXPECT_EQ(policy.BackoffAfter(3).count(), 8000);
  EXPECT_EQ(policy.BackoffAfter(4).count(), 8000);
}

TEST(RetryPolicyTest, TransientStatusClassification) {
  EXPECT_TRUE(RetryPolicy::IsTransientStatus(0));
  EXPECT_TRUE(RetryPolicy::IsTransientStatus(408));
  EXPECT_TRUE(RetryPolicy::IsTransientStatus(429));
  EXPECT_TRUE(RetryPolicy::IsTransientStatus(502));
  EXPECT_FALSE(RetryPolicy::IsTransientStatus(400));
  EXPECT_FALSE(RetryPolicy::IsTransientStatus(404));
}

}  // namespace
}  // namespace dialogcast::providers
