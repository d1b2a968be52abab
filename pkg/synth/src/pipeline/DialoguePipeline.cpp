// Repository: DialogCast
// Component: DialoguePipeline Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/pipeline/DialoguePipeline.hpp"

#include <sstream>
#include <utility>

#include "dialogcast/pipeline/ArtifactWriter.hpp"
#include "dialogcast/pipeline/DebugChunkSpool.hpp"
#include "dialogcast/pipeline/SynthesisScheduler.hpp"
#include "dialogcast/providers/ProviderFactory.hpp"
#include "dialogcast/script/ScriptCleaner.hpp"
#include "dialogcast/script/ScriptSegmenter.hpp"
#include "dialogcast/speed/SpeedNormalizer.hpp"
#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::pipeline {

using dialogcast::util::Logger;
using providers::AudioChunk;
using providers::CancellationToken;
using providers::IProviderAdapter;
using providers::ProviderId;
using providers::ProviderRequest;
using providers::VoicePair;

namespace {

std::string FormatSpeed(double value) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(2);
  oss << value;
  return oss.str();
}

}  // namespace

const char* DialoguePipeline::RunStateName(RunState state) {
  switch (state) {
    case RunState::kIdle:
      return "idle";
    case RunState::kSegmenting:
      return "segmenting";
    case RunState::kResolving:
      return "resolving";
    case RunState::kSynthesizing:
      return "synthesizing";
    case RunState::kAssembling:
      return "assembling";
    case RunState::kDone:
      return "done";
    case RunState::kFailed:
      return "failed";
  }
  return "unknown";
}

const char* DialoguePipeline::SegmentStateName(SegmentState state) {
  switch (state) {
    case SegmentState::kPending:
      return "pending";
    case SegmentState::kResolving:
      return "resolving";
    case SegmentState::kSynthesizing:
      return "synthesizing";
    case SegmentState::kChunked:
      return "chunked";
    case SegmentState::kFailed:
      return "failed";
    case SegmentState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

DialoguePipeline::DialoguePipeline(PipelineConfig config)
    : DialoguePipeline(std::move(config), AdapterFactory()) {}

DialoguePipeline::DialoguePipeline(PipelineConfig config, AdapterFactory factory)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      mapper_(config_.tags),
      assembler_(config_.assembly) {
  if (!factory_) {
    factory_ = [this](ProviderId id, usage::UsageTracker* usage) {
      auto it = config_.providers.find(id);
      providers::ProviderSettings settings =
          it != config_.providers.end() ? it->second : providers::ProviderSettings();
      settings.neutral_label = mapper_.DefaultNeutral(id);
      return providers::CreateProviderAdapter(id, settings, config_.synthesis.retry,
                                              nullptr, usage);
    };
  }
  for (const auto& [id, settings] : config_.providers) {
    if (settings.price_per_1k_chars > 0.0) {
      usage_.SetPricePer1kChars(id, settings.price_per_1k_chars);
    }
  }
}

DialoguePipeline::~DialoguePipeline() = default;

void DialoguePipeline::SetState(RunState to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == to) return;
  Logger::Debug(std::string("[DialoguePipeline] ") + RunStateName(state_) +
                " -> " + RunStateName(to));
  state_ = to;
}

void DialoguePipeline::SetSegmentState(size_t index, SegmentState to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index < segment_states_.size()) segment_states_[index] = to;
}

DialoguePipeline::RunState DialoguePipeline::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::vector<DialoguePipeline::SegmentState> DialoguePipeline::segment_states() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return segment_states_;
}

usage::UsageSummary DialoguePipeline::usage() const { return usage_.Summary(); }

void DialoguePipeline::Cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancel_requested_ = true;
  if (active_scheduler_) active_scheduler_->Cancel();
}

std::optional<double> DialoguePipeline::FixedSpeed(const RunRequest& request,
                                                   script::Speaker speaker) const {
  if (speaker == script::Speaker::kA) {
    return request.speaker_a_speed ? request.speaker_a_speed
                                   : config_.speed_adjustments.speaker_a_speed;
  }
  return request.speaker_b_speed ? request.speaker_b_speed
                                 : config_.speed_adjustments.speaker_b_speed;
}

std::vector<script::Segment> DialoguePipeline::SegmentScript(
    const RunRequest& request) const {
  std::string text = request.script;
  if (config_.clean_script) {
    text = script::CleanScriptForAudio(request.script, config_.boundary_marker);
  }
  script::SegmenterOptions options;
  options.boundary_marker = config_.boundary_marker;
  options.speaker_a_speed = FixedSpeed(request, script::Speaker::kA);
  options.speaker_b_speed = FixedSpeed(request, script::Speaker::kB);
  return script::ScriptSegmenter(options).Split(text);
}

VoicePair DialoguePipeline::LookupVoices(ProviderId provider,
                                         const std::string& language) const {
  auto provider_it = config_.providers.find(provider);
  if (provider_it == config_.providers.end()) return VoicePair{};
  auto voice_it = provider_it->second.voices.find(language);
  if (voice_it == provider_it->second.voices.end()) return VoicePair{};
  return voice_it->second;
}

DialoguePipeline::SpeakerSpeeds DialoguePipeline::SpeakerUserSpeeds(
    double user_speed, const RunRequest& request) const {
  const std::optional<double> fixed_a = FixedSpeed(request, script::Speaker::kA);
  const std::optional<double> fixed_b = FixedSpeed(request, script::Speaker::kB);
  return SpeakerSpeeds{
      speed::ClampUserSpeed(fixed_a ? *fixed_a
                                    : user_speed * config_.speed_adjustments.speaker_a_female),
      speed::ClampUserSpeed(fixed_b ? *fixed_b
                                    : user_speed * config_.speed_adjustments.speaker_b_male)};
}

ProviderRequest DialoguePipeline::ResolveRequest(const script::Segment& segment,
                                                 ProviderId provider,
                                                 const VoicePair& voices,
                                                 const SpeakerSpeeds& speeds) const {
  const bool is_a = segment.speaker == script::Speaker::kA;
  const std::string& voice_id = is_a ? voices.speaker_a : voices.speaker_b;
  if (voice_id.empty()) {
    throw SynthesisError(providers::ProviderName(provider), segment.index,
                         std::string("no voice configured for speaker ") +
                             script::SpeakerName(segment.speaker));
  }

  const double user = segment.speed_override
                          ? speed::ClampUserSpeed(*segment.speed_override)
                          : (is_a ? speeds.user_a : speeds.user_b);

  ProviderRequest request;
  request.segment = segment;
  request.resolved_tags = mapper_.Resolve(segment.emotion_tags, provider);
  request.resolved_speed = speed::ToProviderSpeed(user, provider);
  request.voice_id = voice_id;
  return request;
}

RunResult DialoguePipeline::Run(const RunRequest& request) {
  std::lock_guard<std::mutex> run_lock(run_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = RunState::kIdle;
    segment_states_.clear();
    cancel_requested_ = false;
  }
  usage_.Reset();

  try {
    RunResult result = RunLocked(request);
    SetState(RunState::kDone);
    return result;
  } catch (const SynthesisError& e) {
    SetState(RunState::kFailed);
    Logger::Error("[DialoguePipeline] Run failed at segment " +
                  std::to_string(e.segment_index()) + " (provider " +
                  e.provider() + "): " + e.reason());
    throw;
  } catch (const std::exception& e) {
    SetState(RunState::kFailed);
    Logger::Error(std::string("[DialoguePipeline] Run failed (provider ") +
                  providers::ProviderName(request.provider) + "): " + e.what());
    throw;
  }
}

RunResult DialoguePipeline::RunLocked(const RunRequest& request) {
  const ProviderId provider = request.provider;
  const std::string provider_name = providers::ProviderName(provider);

  auto language = ResolveLanguage(config_, request.language);
  if (!language) throw ConfigError("Unknown language: " + request.language);
  const LanguageSettings& language_settings = config_.languages.at(*language);

  // Segmenting
  SetState(RunState::kSegmenting);
  std::vector<script::Segment> segments = SegmentScript(request);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    segment_states_.assign(segments.size(), SegmentState::kPending);
  }
  Logger::Info("[DialoguePipeline] " + std::to_string(segments.size()) +
               " segments for " + provider_name + " (" + *language + ")");

  // Resolving
  SetState(RunState::kResolving);
  const double user_speed = speed::ClampUserSpeed(
      request.user_speed.value_or(language_settings.default_speed));
  const SpeakerSpeeds speeds = SpeakerUserSpeeds(user_speed, request);
  const VoicePair voices = LookupVoices(provider, *language);

  std::vector<ProviderRequest> requests;
  requests.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    SetSegmentState(i, SegmentState::kResolving);
    try {
      requests.push_back(ResolveRequest(segments[i], provider, voices, speeds));
    } catch (const SynthesisError&) {
      SetSegmentState(i, SegmentState::kFailed);
      throw;
    }
  }

  std::unique_ptr<IProviderAdapter> adapter = factory_(provider, &usage_);
  if (!adapter) throw ConfigError("No adapter for provider " + provider_name);

  std::unique_ptr<DebugChunkSpool> spool;
  if (request.debug_dir && !request.debug_dir->empty()) {
    spool = std::make_unique<DebugChunkSpool>(*request.debug_dir, provider);
  }

  // Synthesizing
  SetState(RunState::kSynthesizing);
  std::vector<SynthesisScheduler::Job> jobs;
  jobs.reserve(requests.size());
  for (size_t i = 0; i < requests.size(); ++i) {
    jobs.push_back([this, i, &requests, &adapter, &spool](
                       const CancellationToken& cancel) -> AudioChunk {
      const ProviderRequest& req = requests[i];
      if (cancel.IsCancelled()) {
        SetSegmentState(i, SegmentState::kCancelled);
        throw CancelledError("segment " + std::to_string(req.segment.index) +
                             " dropped");
      }
      SetSegmentState(i, SegmentState::kSynthesizing);
      if (spool) {
        spool->Write(req.segment.index, adapter->DescribeRequest(req),
                     usage::UsageTracker::CountBilledUnits(req.segment.text));
      }
      try {
        AudioChunk chunk = adapter->Synthesize(req, cancel);
        chunk.segment_index = req.segment.index;
        SetSegmentState(i, SegmentState::kChunked);
        return chunk;
      } catch (const CancelledError&) {
        SetSegmentState(i, SegmentState::kCancelled);
        throw;
      } catch (const std::exception&) {
        SetSegmentState(i, SegmentState::kFailed);
        throw;
      }
    });
  }

  SynthesisScheduler scheduler(config_.synthesis.max_concurrency);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_) throw CancelledError("run cancelled");
    active_scheduler_ = &scheduler;
  }
  std::vector<AudioChunk> chunks;
  try {
    chunks = scheduler.Run(std::move(jobs));
  } catch (...) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_scheduler_ = nullptr;
    // Jobs the scheduler dropped never ran.
    for (auto& s : segment_states_) {
      if (s == SegmentState::kPending || s == SegmentState::kResolving) {
        s = SegmentState::kCancelled;
      }
    }
    throw;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_scheduler_ = nullptr;
  }

  // Assembling
  SetState(RunState::kAssembling);
  RunResult result;
  result.segment_count = segments.size();
  result.audio = assembler_.Assemble(std::move(chunks), request.tier);
  result.usage = usage_.Summary();
  result.display_speed =
      speed::ToDisplaySpeed(speed::ToProviderSpeed(user_speed, provider), provider);
  result.display_speed_a =
      speed::ToDisplaySpeed(speed::ToProviderSpeed(speeds.user_a, provider), provider);
  result.display_speed_b =
      speed::ToDisplaySpeed(speed::ToProviderSpeed(speeds.user_b, provider), provider);

  if (request.output_path && !request.output_path->empty()) {
    WriteAtomically(*request.output_path, result.audio.bytes);
    result.output_path = request.output_path;
  }
  if (spool) spool->RemoveAll();

  Logger::Info("[DialoguePipeline] Done: " + std::to_string(result.segment_count) +
               " segments, " + FormatSpeed(result.audio.duration_seconds) + " s, " +
               std::to_string(result.audio.byte_size) + " bytes, speed A " +
               FormatSpeed(result.display_speed_a) + " / B " +
               FormatSpeed(result.display_speed_b));
  Logger::Info("[DialoguePipeline] Usage: " + result.usage.ToString());
  return result;
}

}  // namespace dialogcast::pipeline
