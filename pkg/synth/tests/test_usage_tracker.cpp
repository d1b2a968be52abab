// Repository: DialogCast
// Component: UsageTracker unit tests

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "dialogcast/usage/UsageTracker.hpp"

namespace dialogcast::usage {
namespace {

using providers::ProviderId;

TEST(UsageTrackerTest, AccumulatesPerProvider) {
  UsageTracker tracker;
  tracker.Record(ProviderId::kCartesia, 10);
  tracker.Record(ProviderId::kCartesia, 5);
  tracker.Record(ProviderId::kElevenLabs, 7);

  const UsageSummary summary = tracker.Summary();
  EXPECT_EQ(summary.per_provider.at(ProviderId::kCartesia).units_billed, 15);
  EXPECT_EQ(summary.per_provider.at(ProviderId::kCartesia).segment_count, 2);
  EXPECT_EQ(summary.per_provider.at(ProviderId::kElevenLabs).units_billed, 7);
  EXPECT_EQ(summary.total_units, 22);
  EXPECT_EQ(summary.total_segments, 3);
}

TEST(UsageTrackerTest, ResetClearsCountsButKeepsPrices) {
  UsageTracker tracker;
  tracker.SetPricePer1kChars(ProviderId::kElevenLabs, 0.30);
  tracker.Record(ProviderId::kElevenLabs, 1000);
  tracker.Reset();

  EXPECT_TRUE(tracker.Summary().per_provider.empty());
  EXPECT_EQ(tracker.Summary().total_units, 0);

  tracker.Record(ProviderId::kElevenLabs, 2000);
  EXPECT_NEAR(tracker.Summary().total_estimated_cost, 0.60, 1e-9);
}

TEST(UsageTrackerTest, BilledUnitsAreCodePoints) {
  EXPECT_EQ(UsageTracker::CountBilledUnits("Hello"), 5);
  EXPECT_EQ(UsageTracker::CountBilledUnits("Grüße"), 5);
  EXPECT_EQ(UsageTracker::CountBilledUnits("\xE2\x80\x94"), 1);
  EXPECT_EQ(UsageTracker::CountBilledUnits(""), 0);
}

TEST(UsageTrackerTest, ConcurrentRecordsAreNotLost) {
  UsageTracker tracker;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&tracker]() {
      for (int i = 0; i < 500; ++i) tracker.Record(ProviderId::kCartesia, 3);
    });
  }
  for (auto& thread : threads) thread.join();

  const UsageSummary summary = tracker.Summary();
  EXPECT_EQ(summary.total_segments, 4000);
  EXPECT_EQ(summary.total_units, 12000);
}

TEST(UsageTrackerTest, SummaryTextNamesProvider) {
  UsageTracker tracker;
  tracker.Record(ProviderId::kCartesia, 12);
  const std::string text = tracker.Summary().ToString();
  EXPECT_NE(text.find("cartesia: 12 chars, 1 segments"), std::string::npos);
}

}  // namespace
}  // namespace dialogcast::usage
