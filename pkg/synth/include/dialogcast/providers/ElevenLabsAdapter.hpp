// Repository: DialogCast
// Component: ElevenLabsAdapter
// Purpose: Text-to-dialogue client. Emotion tags travel as inline "[tag]"
//          markup; response is raw PCM S16LE mono.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_ELEVENLABS_ADAPTER_HPP_
#define DIALOGCAST_PROVIDERS_ELEVENLABS_ADAPTER_HPP_

#include <memory>
#include <string>

#include "dialogcast/providers/HttpTransport.hpp"
#include "dialogcast/providers/IProviderAdapter.hpp"
#include "dialogcast/providers/RetryPolicy.hpp"

namespace dialogcast::usage {
class UsageTracker;
}

namespace dialogcast::providers {

struct ElevenLabsConfig {
  std::string base_url = "https://api.elevenlabs.io";
  std::string model_id = "eleven_v3";
  std::string api_key;
  // Requested as output_format=pcm_<sample_rate>.
  int sample_rate = 24000;
  // Fallback label for unmapped tokens; never spoken as markup.
  std::string neutral_label = "neutral";
  RetryConfig retry;
};

class ElevenLabsAdapter : public IProviderAdapter {
 public:
  // Throws ConfigError when api_key is empty. usage may be null.
  ElevenLabsAdapter(ElevenLabsConfig config,
                    std::shared_ptr<IHttpTransport> transport,
                    usage::UsageTracker* usage);

  AudioChunk Synthesize(const ProviderRequest& request,
                        const CancellationToken& cancel) override;
  ProviderCapabilities Capabilities() const override;
  ProviderId Id() const override { return ProviderId::kElevenLabs; }
  std::string DescribeRequest(const ProviderRequest& request) const override;

  // "[excited] [fast-paced] Hello there", with "--" rendered as an em-dash.
  // The neutral label is left out of the markup.
  std::string ShapeText(const ProviderRequest& request) const;

  std::string RequestPath() const;

 private:
  std::string BuildBody(const ProviderRequest& request) const;

  ElevenLabsConfig config_;
  std::shared_ptr<IHttpTransport> transport_;
  usage::UsageTracker* usage_;
  RetryPolicy retry_;
};

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_ELEVENLABS_ADAPTER_HPP_
