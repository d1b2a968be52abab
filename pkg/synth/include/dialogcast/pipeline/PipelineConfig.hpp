// Repository: DialogCast
// Component: PipelineConfig
// Purpose: Run configuration (providers, voices, languages, speed tuning,
//          synthesis and assembly settings) loaded from a JSON file.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PIPELINE_PIPELINE_CONFIG_HPP_
#define DIALOGCAST_PIPELINE_PIPELINE_CONFIG_HPP_

#include <map>
#include <optional>
#include <string>

#include "dialogcast/audio/AudioAssembler.hpp"
#include "dialogcast/providers/ProviderFactory.hpp"
#include "dialogcast/providers/ProviderId.hpp"
#include "dialogcast/providers/RetryPolicy.hpp"
#include "dialogcast/tags/EmotionTagMapper.hpp"

namespace dialogcast::pipeline {

struct LanguageSettings {
  std::string code;  // "de"
  std::string name;  // "German"
  double default_speed = 1.0;
};

// Per-speaker multipliers applied on top of the user speed.
struct SpeedAdjustments {
  double speaker_a_female = 1.0;
  double speaker_b_male = 1.0;
  // Fixed user-scale speed for every line of that speaker. Replaces
  // user speed x multiplier when set.
  std::optional<double> speaker_a_speed;
  std::optional<double> speaker_b_speed;
};

struct SynthesisSettings {
  // 1 = strictly sequential on the calling thread.
  int max_concurrency = 4;
  providers::RetryConfig retry;
};

// Every field has a usable default; a config file only overrides what it
// names. Keys follow podcast_config.json:
//
// {
//   "providers": {
//     "cartesia": {
//       "api_key_env": "CARTESIA_API_KEY", "model_id": "sonic-english",
//       "base_url": "...", "sample_rate": 44100, "price_per_1k_chars": 0.0,
//       "connect_timeout_s": 30, "read_timeout_s": 120,
//       "voices": { "german": { "speaker_a_female": "...",
//                               "speaker_b_male": "..." } } } },
//   "languages": { "german": { "code": "de", "name": "German", "speed": 1.0 } },
//   "speed_adjustments": { "speaker_a_female": 1.0, "speaker_b_male": 1.0,
//                          "speaker_a_speed": 0.9, "speaker_b_speed": 1.1 },
//   "synthesis": { "max_concurrency": 4, "max_attempts": 3,
//                  "initial_backoff_ms": 2000, "max_backoff_ms": 8000 },
//   "assembly": { "crossfade_ms": 10, "container": "mp3", "sample_rate": 0,
//                 "channels": 0 },
//   "quality": { "prototype": { "sample_rate": 22050, "bitrate_kbps": 64 },
//                "production": { "bitrate_kbps": 192 } },
//   "script": { "boundary_marker": "SOURCES FOUND:", "clean": true },
//   "tags": { "elevenlabs_default_neutral": "neutral",
//             "cartesia_default_neutral": "neutral" }
// }
struct PipelineConfig {
  std::map<providers::ProviderId, providers::ProviderSettings> providers;
  std::map<std::string, LanguageSettings> languages;  // Keyed by name
  SpeedAdjustments speed_adjustments;
  SynthesisSettings synthesis;
  audio::AssemblerConfig assembly;
  tags::TagMapperConfig tags;
  std::string boundary_marker = "SOURCES FOUND:";
  bool clean_script = true;

  // Built-in languages (german/english/dutch) and provider blocks without
  // voices.
  static PipelineConfig Defaults();
};

// Throws ConfigError on unreadable file, invalid JSON or wrong value types.
PipelineConfig LoadPipelineConfig(const std::string& path);
PipelineConfig ParsePipelineConfig(const std::string& json_text);

// Accepts a language name ("german") or code ("de"), case-insensitive.
// Returns the canonical name.
std::optional<std::string> ResolveLanguage(const PipelineConfig& config,
                                           const std::string& name_or_code);

}  // namespace dialogcast::pipeline

#endif  // DIALOGCAST_PIPELINE_PIPELINE_CONFIG_HPP_
