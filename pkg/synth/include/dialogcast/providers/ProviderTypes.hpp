// Repository: DialogCast
// Component: Provider Types
// Purpose: Request/response value types shared by every provider adapter.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_PROVIDER_TYPES_HPP_
#define DIALOGCAST_PROVIDERS_PROVIDER_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dialogcast/script/Segment.hpp"
#include "dialogcast/tags/EmotionTagMapper.hpp"

namespace dialogcast::providers {

enum class QualityTier {
  kPrototype,   // Reduced rate/bitrate, cheap iterations
  kProduction,  // Full fidelity
};

inline const char* QualityTierName(QualityTier tier) {
  return tier == QualityTier::kPrototype ? "prototype" : "production";
}

// Uppercase tag used in artifact names.
inline const char* QualityTierTag(QualityTier tier) {
  return tier == QualityTier::kPrototype ? "PROTOTYPE" : "PRODUCTION";
}

inline std::optional<QualityTier> ParseQualityTier(const std::string& value) {
  if (value == "prototype" || value == "PROTOTYPE") return QualityTier::kPrototype;
  if (value == "production" || value == "PRODUCTION") return QualityTier::kProduction;
  return std::nullopt;
}

enum class AudioEncoding {
  kPcmS16LE,  // Raw interleaved signed 16-bit little-endian
  kMp3,
  kWav,
};

// Everything an adapter needs to synthesize one segment. Built per segment at
// synthesis time by the pipeline; never persisted.
struct ProviderRequest {
  script::Segment segment;
  tags::ProviderTags resolved_tags;
  double resolved_speed = 0.0;  // Provider-native
  std::string voice_id;
};

// Raw audio for one segment. Ownership moves to the assembler.
struct AudioChunk {
  int32_t segment_index = -1;
  std::vector<uint8_t> bytes;
  int sample_rate = 0;
  int channels = 1;
  AudioEncoding encoding = AudioEncoding::kPcmS16LE;
};

struct ProviderCapabilities {
  bool supports_quality_tiers = false;
  int native_sample_rate = 0;
  bool supports_interruption_markup = false;
};

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_PROVIDER_TYPES_HPP_
