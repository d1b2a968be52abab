// Repository: DialogCast
// Component: UsageTracker Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/usage/UsageTracker.hpp"

#include <iomanip>
#include <sstream>

namespace dialogcast::usage {

using providers::ProviderId;

std::string UsageSummary::ToString() const {
  std::ostringstream oss;
  for (const auto& [provider, usage] : per_provider) {
    oss << providers::ProviderName(provider) << ": " << usage.units_billed
        << " chars, " << usage.segment_count << " segments";
    if (usage.estimated_cost > 0.0) {
      oss << ", est. cost " << std::fixed << std::setprecision(4)
          << usage.estimated_cost << std::defaultfloat;
    }
    oss << '\n';
  }
  oss << "total: " << total_units << " chars, " << total_segments
      << " segments";
  return oss.str();
}

void UsageTracker::Record(ProviderId provider, int64_t units_billed) {
  std::lock_guard<std::mutex> lock(mutex_);
  ProviderUsage& usage = usage_[provider];
  usage.units_billed += units_billed;
  usage.segment_count += 1;
}

UsageSummary UsageTracker::Summary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  UsageSummary summary;
  for (const auto& [provider, usage] : usage_) {
    ProviderUsage entry = usage;
    auto price = price_per_1k_.find(provider);
    if (price != price_per_1k_.end()) {
      entry.estimated_cost =
          static_cast<double>(entry.units_billed) / 1000.0 * price->second;
    }
    summary.total_segments += entry.segment_count;
    summary.total_units += entry.units_billed;
    summary.total_estimated_cost += entry.estimated_cost;
    summary.per_provider.emplace(provider, entry);
  }
  return summary;
}

void UsageTracker::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  usage_.clear();
}

void UsageTracker::SetPricePer1kChars(ProviderId provider, double price) {
  std::lock_guard<std::mutex> lock(mutex_);
  price_per_1k_[provider] = price;
}

int64_t UsageTracker::CountBilledUnits(const std::string& utf8_text) {
  int64_t count = 0;
  for (unsigned char c : utf8_text) {
    // Continuation bytes are 10xxxxxx.
    if ((c & 0xC0) != 0x80) ++count;
  }
  return count;
}

}  // namespace dialogcast::usage
