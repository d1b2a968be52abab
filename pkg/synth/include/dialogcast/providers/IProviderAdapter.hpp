// Repository: DialogCast
// Component: Provider Adapter Interface
// Purpose: Uniform synthesis contract implemented by every TTS backend.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_IPROVIDER_ADAPTER_HPP_
#define DIALOGCAST_PROVIDERS_IPROVIDER_ADAPTER_HPP_

#include <string>

#include "dialogcast/providers/CancellationToken.hpp"
#include "dialogcast/providers/ProviderId.hpp"
#include "dialogcast/providers/ProviderTypes.hpp"

namespace dialogcast::providers {

// IProviderAdapter turns one ProviderRequest into one AudioChunk.
//
// Synthesize() is called concurrently from scheduler workers; implementations
// must not keep per-request state in members.
//
// Errors: SynthesisError (permanent, or transient after retries exhausted),
// CancelledError (run cancelled while this request was pending or in flight).
class IProviderAdapter {
 public:
  virtual ~IProviderAdapter() = default;

  virtual AudioChunk Synthesize(const ProviderRequest& request,
                                const CancellationToken& cancel) = 0;

  virtual ProviderCapabilities Capabilities() const = 0;

  virtual ProviderId Id() const = 0;

  // JSON body that Synthesize() would send. Used for debug dumps.
  virtual std::string DescribeRequest(const ProviderRequest& request) const = 0;
};

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_IPROVIDER_ADAPTER_HPP_
