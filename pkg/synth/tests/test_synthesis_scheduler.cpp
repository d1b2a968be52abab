// Repository: DialogCast
// Component: SynthesisScheduler unit tests

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "dialogcast/pipeline/SynthesisScheduler.hpp"
#include "dialogcast/util/Errors.hpp"
#include "fixtures/PcmFixtures.h"

namespace dialogcast::pipeline {
namespace {

using dialogcast::tests::fixtures::PcmChunk;
using providers::AudioChunk;
using providers::CancellationToken;
using Job = SynthesisScheduler::Job;

// Job whose duration shrinks with the index so later jobs finish first.
Job DelayedJob(int32_t index, int32_t total) {
  return [index, total](const CancellationToken& cancel) {
    if (cancel.WaitFor(std::chrono::milliseconds(5 * (total - index)))) {
      throw CancelledError("cancelled");
    }
    return PcmChunk(index, 24000, 0.01);
  };
}

TEST(SynthesisSchedulerTest, ResultsFollowJobOrderNotCompletionOrder) {
  SynthesisScheduler scheduler(4);
  std::vector<Job> jobs;
  for (int32_t i = 0; i < 8; ++i) jobs.push_back(DelayedJob(i, 8));

  const std::vector<AudioChunk> chunks = scheduler.Run(std::move(jobs));

  ASSERT_EQ(chunks.size(), 8u);
  for (int32_t i = 0; i < 8; ++i) EXPECT_EQ(chunks[i].segment_index, i);
}

TEST(SynthesisSchedulerTest, ConcurrencyOneRunsOnCallingThread) {
  SynthesisScheduler scheduler(1);
  const std::thread::id caller = std::this_thread::get_id();
  std::vector<std::thread::id> seen;
  std::vector<Job> jobs;
  for (int32_t i = 0; i < 3; ++i) {
    jobs.push_back([i, &seen](const CancellationToken&) {
      seen.push_back(std::this_thread::get_id());
      return PcmChunk(i, 24000, 0.01);
    });
  }

  EXPECT_EQ(scheduler.Run(std::move(jobs)).size(), 3u);
  ASSERT_EQ(seen.size(), 3u);
  for (const auto& id : seen) EXPECT_EQ(id, caller);
}

TEST(SynthesisSchedulerTest, NeverExceedsMaxConcurrency) {
  SynthesisScheduler scheduler(3);
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  std::vector<Job> jobs;
  for (int32_t i = 0; i < 12; ++i) {
    jobs.push_back([i, &in_flight, &peak](const CancellationToken&) {
      const int now = in_flight.fetch_add(1) + 1;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      in_flight.fetch_sub(1);
      return PcmChunk(i, 24000, 0.01);
    });
  }

  EXPECT_EQ(scheduler.Run(std::move(jobs)).size(), 12u);
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
}

TEST(SynthesisSchedulerTest, EmptyJobListYieldsNoChunks) {
  SynthesisScheduler scheduler(4);
  EXPECT_TRUE(scheduler.Run({}).empty());
}

TEST(SynthesisSchedulerTest, FirstFailureIsRethrownAndCancelsPeers) {
  SynthesisScheduler scheduler(2);
  std::atomic<int> observed_cancel{0};
  std::atomic<int> started{0};
  std::vector<Job> jobs;
  jobs.push_back([&started](const CancellationToken&) -> AudioChunk {
    started.fetch_add(1);
    throw SynthesisError("elevenlabs", 0, "HTTP 401: unauthorized");
  });
  for (int32_t i = 1; i < 10; ++i) {
    jobs.push_back([i, &observed_cancel, &started](const CancellationToken& cancel) {
      started.fetch_add(1);
      if (cancel.WaitFor(std::chrono::milliseconds(2000))) {
        observed_cancel.fetch_add(1);
        throw CancelledError("cancelled");
      }
      return PcmChunk(i, 24000, 0.01);
    });
  }

  const auto begin = std::chrono::steady_clock::now();
  try {
    scheduler.Run(std::move(jobs));
    FAIL() << "expected SynthesisError";
  } catch (const SynthesisError& e) {
    EXPECT_EQ(e.segment_index(), 0);
    EXPECT_EQ(e.provider(), "elevenlabs");
  }
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  // The peer in flight was woken instead of waiting out its 2 s.
  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
  EXPECT_LE(observed_cancel.load(), 1);
  // Queued jobs were dropped.
  EXPECT_LT(started.load(), 10);
}

TEST(SynthesisSchedulerTest, NonSynthesisErrorsPropagateUnchanged) {
  SynthesisScheduler scheduler(1);
  std::vector<Job> jobs;
  jobs.push_back([](const CancellationToken&) -> AudioChunk {
    throw std::logic_error("boom");
  });
  EXPECT_THROW(scheduler.Run(std::move(jobs)), std::logic_error);
}

TEST(SynthesisSchedulerTest, ExternalCancelRaisesCancelledError) {
  SynthesisScheduler scheduler(2);
  std::atomic<int> started{0};
  std::vector<Job> jobs;
  for (int32_t i = 0; i < 4; ++i) {
    jobs.push_back([i, &started](const CancellationToken& cancel) {
      started.fetch_add(1);
      if (cancel.WaitFor(std::chrono::milliseconds(5000))) {
        throw CancelledError("cancelled");
      }
      return PcmChunk(i, 24000, 0.01);
    });
  }

  std::thread canceller([&scheduler, &started] {
    while (started.load() == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    scheduler.Cancel();
  });
  EXPECT_THROW(scheduler.Run(std::move(jobs)), CancelledError);
  canceller.join();
}

TEST(SynthesisSchedulerTest, CancelBeforeRunIsHonoured) {
  SynthesisScheduler scheduler(2);
  scheduler.Cancel();

  std::atomic<int> started{0};
  std::vector<Job> jobs;
  for (int32_t i = 0; i < 3; ++i) {
    jobs.push_back([i, &started](const CancellationToken&) {
      started.fetch_add(1);
      return PcmChunk(i, 24000, 0.01);
    });
  }
  EXPECT_THROW(scheduler.Run(std::move(jobs)), CancelledError);
  EXPECT_EQ(started.load(), 0);

  // The held request is consumed by the run it cancelled.
  std::vector<Job> next;
  for (int32_t i = 0; i < 3; ++i) next.push_back(DelayedJob(i, 3));
  EXPECT_EQ(scheduler.Run(std::move(next)).size(), 3u);
}

TEST(SynthesisSchedulerTest, SchedulerIsReusableAfterFailure) {
  SynthesisScheduler scheduler(2);
  std::vector<Job> failing;
  failing.push_back([](const CancellationToken&) -> AudioChunk {
    throw SynthesisError("cartesia", 0, "HTTP 400");
  });
  EXPECT_THROW(scheduler.Run(std::move(failing)), SynthesisError);

  std::vector<Job> jobs;
  for (int32_t i = 0; i < 3; ++i) jobs.push_back(DelayedJob(i, 3));
  EXPECT_EQ(scheduler.Run(std::move(jobs)).size(), 3u);
}

}  // namespace
}  // namespace dialogcast::pipeline
