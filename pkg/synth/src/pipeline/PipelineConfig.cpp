// Repository: DialogCast
// Component: PipelineConfig Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/pipeline/PipelineConfig.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>

#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::pipeline {

using dialogcast::util::Logger;
using nlohmann::json;
using providers::ProviderId;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

void ParseProvider(ProviderId id, const json& j,
                   providers::ProviderSettings& out) {
  out.api_key_env = j.value("api_key_env", out.api_key_env);
  out.base_url = j.value("base_url", out.base_url);
  out.model_id = j.value("model_id", out.model_id);
  out.sample_rate = j.value("sample_rate", out.sample_rate);
  out.price_per_1k_chars = j.value("price_per_1k_chars", out.price_per_1k_chars);
  out.timeouts.connect_seconds =
      j.value("connect_timeout_s", out.timeouts.connect_seconds);
  out.timeouts.read_seconds = j.value("read_timeout_s", out.timeouts.read_seconds);

  if (!j.contains("voices")) return;
  for (const auto& [language, voices] : j.at("voices").items()) {
    providers::VoicePair pair;
    // Either gender label is accepted for each seat.
    pair.speaker_a = voices.value("speaker_a_female",
                                  voices.value("speaker_a_male", std::string()));
    pair.speaker_b = voices.value("speaker_b_male",
                                  voices.value("speaker_b_female", std::string()));
    out.voices[Lower(language)] = pair;
  }
  Logger::Debug("[PipelineConfig] " + providers::ProviderName(id) + ": " +
                std::to_string(out.voices.size()) + " voice sets");
}

}  // namespace

PipelineConfig PipelineConfig::Defaults() {
  PipelineConfig config;
  config.languages["german"] = LanguageSettings{"de", "German", 1.0};
  config.languages["english"] = LanguageSettings{"en", "English", 1.0};
  config.languages["dutch"] = LanguageSettings{"nl", "Dutch", 1.0};

  providers::ProviderSettings elevenlabs;
  elevenlabs.api_key_env = providers::DefaultApiKeyEnv(ProviderId::kElevenLabs);
  config.providers[ProviderId::kElevenLabs] = elevenlabs;

  providers::ProviderSettings cartesia;
  cartesia.api_key_env = providers::DefaultApiKeyEnv(ProviderId::kCartesia);
  config.providers[ProviderId::kCartesia] = cartesia;
  return config;
}

PipelineConfig ParsePipelineConfig(const std::string& json_text) {
  PipelineConfig config = PipelineConfig::Defaults();
  try {
    const json root = json::parse(json_text);
    if (!root.is_object()) throw ConfigError("config root must be an object");

    if (root.contains("providers")) {
      for (const auto& [name, block] : root.at("providers").items()) {
        auto id = providers::ParseProviderId(name);
        if (!id) {
          Logger::Warn("[PipelineConfig] Ignoring unknown provider '" + name + "'");
          continue;
        }
        ParseProvider(*id, block, config.providers[*id]);
      }
    }

    if (root.contains("languages")) {
      for (const auto& [name, block] : root.at("languages").items()) {
        LanguageSettings& lang = config.languages[Lower(name)];
        lang.code = Lower(block.value("code", lang.code));
        lang.name = block.value("name", lang.name.empty() ? name : lang.name);
        lang.default_speed = block.value("speed", lang.default_speed);
      }
    }

    if (root.contains("speed_adjustments")) {
      const json& adj = root.at("speed_adjustments");
      config.speed_adjustments.speaker_a_female =
          adj.value("speaker_a_female", config.speed_adjustments.speaker_a_female);
      config.speed_adjustments.speaker_b_male =
          adj.value("speaker_b_male", config.speed_adjustments.speaker_b_male);
      if (adj.contains("speaker_a_speed")) {
        config.speed_adjustments.speaker_a_speed = adj.at("speaker_a_speed").get<double>();
      }
      if (adj.contains("speaker_b_speed")) {
        config.speed_adjustments.speaker_b_speed = adj.at("speaker_b_speed").get<double>();
      }
    }

    if (root.contains("synthesis")) {
      const json& syn = root.at("synthesis");
      SynthesisSettings& s = config.synthesis;
      s.max_concurrency = std::max(1, syn.value("max_concurrency", s.max_concurrency));
      s.retry.max_attempts = std::max(1, syn.value("max_attempts", s.retry.max_attempts));
      s.retry.initial_backoff = std::chrono::milliseconds(
          syn.value("initial_backoff_ms",
                    static_cast<int64_t>(s.retry.initial_backoff.count())));
      s.retry.max_backoff = std::chrono::milliseconds(syn.value(
          "max_backoff_ms", static_cast<int64_t>(s.retry.max_backoff.count())));
      s.retry.backoff_multiplier =
          syn.value("backoff_multiplier", s.retry.backoff_multiplier);
    }

    if (root.contains("assembly")) {
      const json& asmb = root.at("assembly");
      audio::AssemblerConfig& a = config.assembly;
      a.crossfade_ms = asmb.value("crossfade_ms", a.crossfade_ms);
      a.target_sample_rate = asmb.value("sample_rate", a.target_sample_rate);
      a.target_channels = asmb.value("channels", a.target_channels);
      const std::string container = asmb.value("container", std::string("mp3"));
      auto parsed = audio::ParseOutputContainer(Lower(container));
      if (!parsed) throw ConfigError("unknown assembly.container '" + container + "'");
      a.container = *parsed;
    }

    if (root.contains("quality")) {
      const json& q = root.at("quality");
      audio::AssemblerConfig& a = config.assembly;
      if (q.contains("prototype")) {
        a.prototype_sample_rate =
            q.at("prototype").value("sample_rate", a.prototype_sample_rate);
        a.prototype_bitrate_kbps =
            q.at("prototype").value("bitrate_kbps", a.prototype_bitrate_kbps);
      }
      if (q.contains("production")) {
        a.production_bitrate_kbps =
            q.at("production").value("bitrate_kbps", a.production_bitrate_kbps);
      }
    }

    if (root.contains("script")) {
      const json& sc = root.at("script");
      config.boundary_marker = sc.value("boundary_marker", config.boundary_marker);
      config.clean_script = sc.value("clean", config.clean_script);
    }

    if (root.contains("tags")) {
      const json& t = root.at("tags");
      config.tags.elevenlabs_default_neutral =
          t.value("elevenlabs_default_neutral", config.tags.elevenlabs_default_neutral);
      config.tags.cartesia_default_neutral =
          t.value("cartesia_default_neutral", config.tags.cartesia_default_neutral);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid config: ") + e.what());
  }
  return config;
}

PipelineConfig LoadPipelineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  PipelineConfig config = ParsePipelineConfig(ss.str());
  Logger::Info("[PipelineConfig] Loaded " + path);
  return config;
}

std::optional<std::string> ResolveLanguage(const PipelineConfig& config,
                                           const std::string& name_or_code) {
  const std::string key = Lower(name_or_code);
  if (config.languages.count(key)) return key;
  for (const auto& [name, lang] : config.languages) {
    if (lang.code == key) return name;
  }
  return std::nullopt;
}

}  // namespace dialogcast::pipeline
