// Repository: DialogCast
// Component: ProviderFactory
// Purpose: Builds the adapter for a ProviderId from its settings block.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_PROVIDER_FACTORY_HPP_
#define DIALOGCAST_PROVIDERS_PROVIDER_FACTORY_HPP_

#include <map>
#include <memory>
#include <string>

#include "dialogcast/providers/HttpTransport.hpp"
#include "dialogcast/providers/IProviderAdapter.hpp"
#include "dialogcast/providers/ProviderId.hpp"
#include "dialogcast/providers/RetryPolicy.hpp"

namespace dialogcast::usage {
class UsageTracker;
}

namespace dialogcast::providers {

// Voice ids for one language.
struct VoicePair {
  std::string speaker_a;  // Female host
  std::string speaker_b;  // Male host
};

// One "providers.<name>" block of the configuration file.
// Empty strings and zero values select the adapter defaults.
struct ProviderSettings {
  std::string api_key_env;  // Environment variable holding the key
  std::string api_key;      // Takes precedence over api_key_env when set
  std::string base_url;
  std::string model_id;
  int sample_rate = 0;
  double price_per_1k_chars = 0.0;
  TransportTimeouts timeouts;
  // Label that means "no emotion"; never sent to the provider.
  std::string neutral_label;
  std::map<std::string, VoicePair> voices;  // Keyed by language name
};

// Default environment variable for the provider's API key.
std::string DefaultApiKeyEnv(ProviderId id);

// Resolves the API key (explicit key, then environment). Throws ConfigError
// naming the variable when neither yields a value.
std::string ResolveApiKey(ProviderId id, const ProviderSettings& settings);

// transport == nullptr builds an HttplibTransport for the provider base URL.
std::unique_ptr<IProviderAdapter> CreateProviderAdapter(
    ProviderId id, const ProviderSettings& settings, const RetryConfig& retry,
    std::shared_ptr<IHttpTransport> transport, usage::UsageTracker* usage);

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_PROVIDER_FACTORY_HPP_
