// Repository: DialogCast
// Component: Provider Identity
// Purpose: Enumerates the supported TTS backends and their naming tags.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_PROVIDER_ID_HPP_
#define DIALOGCAST_PROVIDERS_PROVIDER_ID_HPP_

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace dialogcast::providers {

enum class ProviderId {
  kElevenLabs = 0,
  kCartesia = 1,
};

// Config/CLI key ("elevenlabs", "cartesia").
inline std::string ProviderName(ProviderId id) {
  switch (id) {
    case ProviderId::kElevenLabs:
      return "elevenlabs";
    case ProviderId::kCartesia:
      return "cartesia";
  }
  return "unknown";
}

// Four-letter tag embedded in artifact names.
inline std::string ProviderTag(ProviderId id) {
  switch (id) {
    case ProviderId::kElevenLabs:
      return "11LB";
    case ProviderId::kCartesia:
      return "CRTS";
  }
  return "UNKN";
}

// Accepts the config key or the artifact tag, case-insensitive.
inline std::optional<ProviderId> ParseProviderId(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (value == "elevenlabs" || value == "11lb") return ProviderId::kElevenLabs;
  if (value == "cartesia" || value == "crts") return ProviderId::kCartesia;
  return std::nullopt;
}

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_PROVIDER_ID_HPP_
