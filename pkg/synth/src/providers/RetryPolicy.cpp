// Repository: DialogCast
// Component: RetryPolicy Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/providers/RetryPolicy.hpp"

#include <algorithm>
#include <sstream>

#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::providers {

using dialogcast::util::Logger;

namespace {

constexpr size_t kMaxBodyExcerpt = 300;

std::string BodyExcerpt(const std::string& body) {
  if (body.size() <= kMaxBodyExcerpt) return body;
  return body.substr(0, kMaxBodyExcerpt) + "...";
}

}  // namespace

RetryPolicy::RetryPolicy(RetryConfig config) : config_(config) {
  if (config_.max_attempts < 1) config_.max_attempts = 1;
}

bool RetryPolicy::IsTransientStatus(int status) {
  return status == 0 || status == 408 || status == 429 ||
         (status >= 500 && status <= 599);
}

std::chrono::milliseconds RetryPolicy::BackoffAfter(int attempt) const {
  double delay_ms = static_cast<double>(config_.initial_backoff.count());
  for (int i = 1; i < attempt; ++i) {
    delay_ms *= config_.backoff_multiplier;
  }
  const auto cap = static_cast<double>(config_.max_backoff.count());
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::min(delay_ms, cap)));
}

void RetryPolicy::Classify(const HttpResponse& response,
                           const std::string& provider,
                           int32_t segment_index) {
  if (response.status >= 200 && response.status < 300) return;

  if (response.status == 0) {
    throw TransientProviderError(provider, segment_index, 0,
                                 response.error.empty() ? "no response"
                                                        : response.error);
  }
  if (IsTransientStatus(response.status)) {
    throw TransientProviderError(provider, segment_index, response.status,
                                 BodyExcerpt(response.body));
  }
  throw SynthesisError(provider, segment_index,
                       "HTTP " + std::to_string(response.status) + ": " +
                           BodyExcerpt(response.body));
}

HttpResponse RetryPolicy::Execute(const std::string& provider,
                                  int32_t segment_index,
                                  const CancellationToken& cancel,
                                  const AttemptFn& attempt) const {
  std::string last_failure;
  for (int n = 1; n <= config_.max_attempts; ++n) {
    if (cancel.IsCancelled()) {
      throw CancelledError("[" + provider + "] segment " +
                           std::to_string(segment_index) + " cancelled");
    }

    HttpResponse response = attempt();
    try {
      Classify(response, provider, segment_index);
      return response;
    } catch (const TransientProviderError& e) {
      if (response.aborted || cancel.IsCancelled()) {
        throw CancelledError("[" + provider + "] segment " +
                             std::to_string(segment_index) +
                             " cancelled in flight");
      }
      last_failure = e.what();
      if (n == config_.max_attempts) break;

      const auto delay = BackoffAfter(n);
      std::ostringstream oss;
      oss << "[RetryPolicy] " << e.what() << " (attempt " << n << "/"
          << config_.max_attempts << "), retrying in " << delay.count()
          << " ms";
      Logger::Warn(oss.str());

      if (cancel.WaitFor(delay)) {
        throw CancelledError("[" + provider + "] segment " +
                             std::to_string(segment_index) +
                             " cancelled during backoff");
      }
    }
  }

  throw SynthesisError(provider, segment_index,
                       "gave up after " + std::to_string(config_.max_attempts) +
                           " attempts: " + last_failure);
}

}  // namespace dialogcast::providers
