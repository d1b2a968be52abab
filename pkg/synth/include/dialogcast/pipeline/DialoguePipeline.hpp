// Repository: DialogCast
// Component: DialoguePipeline
// Purpose: End-to-end run: script -> segments -> provider requests ->
//          parallel synthesis -> assembled artifact + usage summary.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PIPELINE_DIALOGUE_PIPELINE_HPP_
#define DIALOGCAST_PIPELINE_DIALOGUE_PIPELINE_HPP_

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dialogcast/audio/AudioAssembler.hpp"
#include "dialogcast/pipeline/PipelineConfig.hpp"
#include "dialogcast/providers/IProviderAdapter.hpp"
#include "dialogcast/providers/ProviderId.hpp"
#include "dialogcast/providers/ProviderTypes.hpp"
#include "dialogcast/tags/EmotionTagMapper.hpp"
#include "dialogcast/usage/UsageTracker.hpp"

namespace dialogcast::pipeline {

class SynthesisScheduler;

struct RunRequest {
  std::string script;
  providers::ProviderId provider = providers::ProviderId::kElevenLabs;
  std::string language = "german";  // Name or code
  // Unset: the language's default speed.
  std::optional<double> user_speed;
  // Fixed per-speaker speeds; take precedence over the configured ones.
  std::optional<double> speaker_a_speed;
  std::optional<double> speaker_b_speed;
  providers::QualityTier tier = providers::QualityTier::kPrototype;
  // Unset: the artifact is only returned, not written.
  std::optional<std::string> output_path;
  // Set: per-segment request dumps land here (removed on success).
  std::optional<std::string> debug_dir;
};

struct RunResult {
  audio::AssembledAudio audio;
  usage::UsageSummary usage;
  size_t segment_count = 0;
  // Shared user scale, recovered from the native values actually sent.
  double display_speed = 1.0;
  double display_speed_a = 1.0;
  double display_speed_b = 1.0;
  std::optional<std::string> output_path;
};

// Builds the adapter for one run. usage must receive one Record() per
// successful synthesis call.
using AdapterFactory = std::function<std::unique_ptr<providers::IProviderAdapter>(
    providers::ProviderId provider, usage::UsageTracker* usage)>;

// DialoguePipeline drives one run at a time.
//
// Run states:
//   kIdle -> kSegmenting -> kResolving -> kSynthesizing -> kAssembling
//         -> kDone
//   any failure -> kFailed
// Per-segment states:
//   kPending -> kResolving -> kSynthesizing -> kChunked
//   kFailed (this segment's error aborted the run), kCancelled (dropped or
//   interrupted because another segment failed)
//
// Error contract: MalformedScriptError, ConfigError, SynthesisError,
// AssemblyError and std::runtime_error (artifact write) propagate from Run()
// after being logged. A failed run never leaves a file at output_path.
class DialoguePipeline {
 public:
  enum class RunState {
    kIdle = 0,
    kSegmenting = 1,
    kResolving = 2,
    kSynthesizing = 3,
    kAssembling = 4,
    kDone = 5,
    kFailed = 6,
  };

  enum class SegmentState {
    kPending = 0,
    kResolving = 1,
    kSynthesizing = 2,
    kChunked = 3,
    kFailed = 4,
    kCancelled = 5,
  };

  // Adapters come from CreateProviderAdapter() with the configured settings.
  explicit DialoguePipeline(PipelineConfig config);
  DialoguePipeline(PipelineConfig config, AdapterFactory factory);
  ~DialoguePipeline();

  DialoguePipeline(const DialoguePipeline&) = delete;
  DialoguePipeline& operator=(const DialoguePipeline&) = delete;

  RunResult Run(const RunRequest& request);

  // Aborts the run in progress from another thread.
  void Cancel();

  [[nodiscard]] RunState state() const;
  [[nodiscard]] std::vector<SegmentState> segment_states() const;
  // Usage of the current or most recent run.
  [[nodiscard]] usage::UsageSummary usage() const;

  const PipelineConfig& config() const { return config_; }

  static const char* RunStateName(RunState state);
  static const char* SegmentStateName(SegmentState state);

 private:
  struct SpeakerSpeeds {
    double user_a;
    double user_b;
  };

  void SetState(RunState to);
  void SetSegmentState(size_t index, SegmentState to);

  std::optional<double> FixedSpeed(const RunRequest& request,
                                   script::Speaker speaker) const;
  std::vector<script::Segment> SegmentScript(const RunRequest& request) const;
  providers::VoicePair LookupVoices(providers::ProviderId provider,
                                    const std::string& language) const;
  SpeakerSpeeds SpeakerUserSpeeds(double user_speed, const RunRequest& request) const;
  providers::ProviderRequest ResolveRequest(const script::Segment& segment,
                                            providers::ProviderId provider,
                                            const providers::VoicePair& voices,
                                            const SpeakerSpeeds& speeds) const;

  RunResult RunLocked(const RunRequest& request);

  PipelineConfig config_;
  AdapterFactory factory_;
  tags::EmotionTagMapper mapper_;
  audio::AudioAssembler assembler_;
  usage::UsageTracker usage_;

  std::mutex run_mutex_;  // Serializes Run()

  mutable std::mutex mutex_;
  RunState state_ = RunState::kIdle;               // Guarded by mutex_
  std::vector<SegmentState> segment_states_;       // Guarded by mutex_
  SynthesisScheduler* active_scheduler_ = nullptr;  // Guarded by mutex_
  bool cancel_requested_ = false;                   // Guarded by mutex_
};

}  // namespace dialogcast::pipeline

#endif  // DIALOGCAST_PIPELINE_DIALOGUE_PIPELINE_HPP_
