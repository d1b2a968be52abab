// Repository: DialogCast
// Component: AudioAssembler
// Purpose: Orders per-segment audio chunks, makes their format uniform,
//          joins them with short crossfades and encodes one artifact.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_AUDIO_AUDIO_ASSEMBLER_HPP_
#define DIALOGCAST_AUDIO_AUDIO_ASSEMBLER_HPP_

#include <cstdint>
#include <vector>

#include "dialogcast/audio/AudioEncoder.hpp"
#include "dialogcast/audio/PcmOps.hpp"
#include "dialogcast/providers/ProviderTypes.hpp"

namespace dialogcast::audio {

struct AssemblerConfig {
  // Linear crossfade at every chunk boundary.
  int crossfade_ms = 10;
  // 0 selects the highest rate / channel count found among the chunks.
  int target_sample_rate = 0;
  int target_channels = 0;

  OutputContainer container = OutputContainer::kMp3;
  int production_bitrate_kbps = 192;
  int prototype_bitrate_kbps = 64;
  // Prototype mixes are downsampled to this rate before encoding
  // (never upsampled).
  int prototype_sample_rate = 22050;
};

struct AssembledAudio {
  std::vector<uint8_t> bytes;
  OutputContainer container = OutputContainer::kMp3;
  int sample_rate = 0;
  int channels = 0;
  double duration_seconds = 0.0;
  size_t byte_size = 0;
};

// Assemble() steps:
//   1. Sort chunks by segment index; reject empty input, duplicates and gaps.
//   2. Decode each chunk to S16 PCM (raw PCM as-is, containers via FFmpeg).
//   3. Resample every chunk to the target rate/channels.
//   4. Concatenate with a crossfade at each boundary.
//   5. Apply the quality tier and encode.
//
// Any failure throws AssemblyError; no partial output is returned.
// Output bytes depend only on the chunk contents and their indices, not on
// the order the chunks were passed in.
class AudioAssembler {
 public:
  explicit AudioAssembler(AssemblerConfig config = AssemblerConfig());

  AssembledAudio Assemble(std::vector<providers::AudioChunk> chunks,
                          providers::QualityTier tier) const;

  // Steps 1-4. Exposed for tests.
  PcmBuffer Mix(std::vector<providers::AudioChunk> chunks) const;

  // Step 1. Sorts in place; throws AssemblyError.
  static void OrderAndValidate(std::vector<providers::AudioChunk>& chunks);

  // Step 2. Throws AssemblyError.
  static PcmBuffer DecodeChunk(const providers::AudioChunk& chunk);

  const AssemblerConfig& config() const { return config_; }

 private:
  AssemblerConfig config_;
};

}  // namespace dialogcast::audio

#endif  // DIALOGCAST_AUDIO_AUDIO_ASSEMBLER_HPP_
