// Repository: DialogCast
// Component: UsageTracker
// Purpose: Accumulates billed characters and segment counts per provider
//          across one synthesis run.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_USAGE_USAGE_TRACKER_HPP_
#define DIALOGCAST_USAGE_USAGE_TRACKER_HPP_

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "dialogcast/providers/ProviderId.hpp"

namespace dialogcast::usage {

struct ProviderUsage {
  int64_t units_billed = 0;  // Characters (Unicode code points)
  int64_t segment_count = 0;
  double estimated_cost = 0.0;  // 0 when no price is configured
};

struct UsageSummary {
  std::map<providers::ProviderId, ProviderUsage> per_provider;
  int64_t total_segments = 0;
  int64_t total_units = 0;
  double total_estimated_cost = 0.0;

  // One line per provider, e.g. "cartesia: 1234 chars, 12 segments".
  std::string ToString() const;
};

// Thread-safe: Record() is called from synthesis workers.
class UsageTracker {
 public:
  UsageTracker() = default;

  UsageTracker(const UsageTracker&) = delete;
  UsageTracker& operator=(const UsageTracker&) = delete;

  // Once per successful synthesis call.
  void Record(providers::ProviderId provider, int64_t units_billed);

  UsageSummary Summary() const;

  // Clears counters (prices are kept). Called at the start of every run.
  void Reset();

  // Price in the provider's currency unit per 1000 billed characters.
  void SetPricePer1kChars(providers::ProviderId provider, double price);

  // Billing unit: Unicode code points of the UTF-8 text sent.
  static int64_t CountBilledUnits(const std::string& utf8_text);

 private:
  mutable std::mutex mutex_;
  std::map<providers::ProviderId, ProviderUsage> usage_;
  std::map<providers::ProviderId, double> price_per_1k_;
};

}  // namespace dialogcast::usage

#endif  // DIALOGCAST_USAGE_USAGE_TRACKER_HPP_
