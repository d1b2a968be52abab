// Repository: DialogCast
// Component: CartesiaAdapter
// Purpose: Bytes-endpoint client. Emotion travels as one experimental control
//          label; response is MP3.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_CARTESIA_ADAPTER_HPP_
#define DIALOGCAST_PROVIDERS_CARTESIA_ADAPTER_HPP_

#include <memory>
#include <string>

#include "dialogcast/providers/HttpTransport.hpp"
#include "dialogcast/providers/IProviderAdapter.hpp"
#include "dialogcast/providers/RetryPolicy.hpp"

namespace dialogcast::usage {
class UsageTracker;
}

namespace dialogcast::providers {

struct CartesiaConfig {
  std::string base_url = "https://api.cartesia.ai";
  std::string model_id = "sonic-english";
  std::string api_key;
  std::string api_version = "2024-06-10";
  int sample_rate = 44100;
  // Never sent as an emotion control.
  std::string neutral_label = "neutral";
  RetryConfig retry;
};

class CartesiaAdapter : public IProviderAdapter {
 public:
  // Throws ConfigError when api_key is empty. usage may be null.
  CartesiaAdapter(CartesiaConfig config,
                  std::shared_ptr<IHttpTransport> transport,
                  usage::UsageTracker* usage);

  AudioChunk Synthesize(const ProviderRequest& request,
                        const CancellationToken& cancel) override;
  ProviderCapabilities Capabilities() const override;
  ProviderId Id() const override { return ProviderId::kCartesia; }
  std::string DescribeRequest(const ProviderRequest& request) const override;

 private:
  std::string BuildBody(const ProviderRequest& request) const;

  CartesiaConfig config_;
  std::shared_ptr<IHttpTransport> transport_;
  usage::UsageTracker* usage_;
  RetryPolicy retry_;
};

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_CARTESIA_ADAPTER_HPP_
