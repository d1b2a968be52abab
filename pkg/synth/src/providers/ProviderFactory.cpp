// Repository: DialogCast
// Component: ProviderFactory Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/providers/ProviderFactory.hpp"

#include <cstdlib>

#include "dialogcast/providers/CartesiaAdapter.hpp"
#include "dialogcast/providers/ElevenLabsAdapter.hpp"
#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::providers {

using dialogcast::util::Logger;

std::string DefaultApiKeyEnv(ProviderId id) {
  switch (id) {
    case ProviderId::kElevenLabs:
      return "ELEVENLABS_API_KEY";
    case ProviderId::kCartesia:
      return "CARTESIA_API_KEY";
  }
  return "";
}

std::string ResolveApiKey(ProviderId id, const ProviderSettings& settings) {
  if (!settings.api_key.empty()) return settings.api_key;
  const std::string env_name = settings.api_key_env.empty()
                                   ? DefaultApiKeyEnv(id)
                                   : settings.api_key_env;
  const char* value = std::getenv(env_name.c_str());
  if (value == nullptr || *value == '\0') {
    throw ConfigError("No API key for " + ProviderName(id) + ": set " +
                      env_name);
  }
  return value;
}

std::unique_ptr<IProviderAdapter> CreateProviderAdapter(
    ProviderId id, const ProviderSettings& settings, const RetryConfig& retry,
    std::shared_ptr<IHttpTransport> transport, usage::UsageTracker* usage) {
  switch (id) {
    case ProviderId::kElevenLabs: {
      ElevenLabsConfig config;
      config.api_key = ResolveApiKey(id, settings);
      if (!settings.base_url.empty()) config.base_url = settings.base_url;
      if (!settings.model_id.empty()) config.model_id = settings.model_id;
      if (settings.sample_rate > 0) config.sample_rate = settings.sample_rate;
      if (!settings.neutral_label.empty()) config.neutral_label = settings.neutral_label;
      config.retry = retry;
      if (!transport) {
        transport = std::make_shared<HttplibTransport>(config.base_url,
                                                       settings.timeouts);
      }
      Logger::Info("[ProviderFactory] ElevenLabs model=" + config.model_id +
                   " pcm_" + std::to_string(config.sample_rate));
      return std::make_unique<ElevenLabsAdapter>(std::move(config),
                                                 std::move(transport), usage);
    }
    case ProviderId::kCartesia: {
      CartesiaConfig config;
      config.api_key = ResolveApiKey(id, settings);
      if (!settings.base_url.empty()) config.base_url = settings.base_url;
      if (!settings.model_id.empty()) config.model_id = settings.model_id;
      if (settings.sample_rate > 0) config.sample_rate = settings.sample_rate;
      if (!settings.neutral_label.empty()) config.neutral_label = settings.neutral_label;
      config.retry = retry;
      if (!transport) {
        transport = std::make_shared<HttplibTransport>(config.base_url,
                                                       settings.timeouts);
      }
      Logger::Info("[ProviderFactory] Cartesia model=" + config.model_id +
                   " mp3@" + std::to_string(config.sample_rate));
      return std::make_unique<CartesiaAdapter>(std::move(config),
                                               std::move(transport), usage);
    }
  }
  throw ConfigError("Unknown provider id " +
                    std::to_string(static_cast<int>(id)));
}

}  // namespace dialogcast::providers
