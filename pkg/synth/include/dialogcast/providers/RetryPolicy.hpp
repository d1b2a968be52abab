// Repository: DialogCast
// Component: RetryPolicy
// Purpose: Bounded exponential-backoff loop around one provider HTTP call.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_RETRY_POLICY_HPP_
#define DIALOGCAST_PROVIDERS_RETRY_POLICY_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "dialogcast/providers/CancellationToken.hpp"
#include "dialogcast/providers/HttpTransport.hpp"

namespace dialogcast::providers {

struct RetryConfig {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{2000};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{8000};
};

// Classification:
//   2xx                     -> success
//   no response, 408, 429, 5xx -> TransientProviderError (retried)
//   anything else           -> SynthesisError (immediate)
//
// Exhausting max_attempts escalates the last transient failure to
// SynthesisError. Cancellation (token raised, or a transfer aborted through
// it) throws CancelledError from any attempt or backoff wait.
class RetryPolicy {
 public:
  using AttemptFn = std::function<HttpResponse()>;

  explicit RetryPolicy(RetryConfig config = RetryConfig());

  HttpResponse Execute(const std::string& provider, int32_t segment_index,
                       const CancellationToken& cancel,
                       const AttemptFn& attempt) const;

  // Delay after failed attempt `attempt` (1-based), capped at max_backoff.
  std::chrono::milliseconds BackoffAfter(int attempt) const;

  static bool IsTransientStatus(int status);

  const RetryConfig& config() const { return config_; }

 private:
  // Throws for any non-2xx response.
  static void Classify(const HttpResponse& response,
                       const std::string& provider, int32_t segment_index);

  RetryConfig config_;
};

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_RETRY_POLICY_HPP_
