// Repository: DialogCast
// Component: PCM Operations
// Purpose: Interleaved S16 buffer type plus clamping and linear crossfade.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_AUDIO_PCM_OPS_HPP_
#define DIALOGCAST_AUDIO_PCM_OPS_HPP_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dialogcast::audio {

// Interleaved signed 16-bit PCM.
struct PcmBuffer {
  int sample_rate = 0;
  int channels = 0;
  std::vector<int16_t> samples;

  int64_t frames() const {
    return channels > 0 ? static_cast<int64_t>(samples.size()) / channels : 0;
  }

  double DurationSeconds() const {
    return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
  }
};

// Clamps to int16 range [-32768, +32767], no wraparound.
inline int16_t ClampToS16(float value) {
  if (value > 32767.0f) return 32767;
  if (value < -32768.0f) return -32768;
  return static_cast<int16_t>(value);
}

// Fade length for one boundary: crossfade_ms at sample_rate, shortened to
// the shorter neighbour so a fade never spans more than one chunk.
inline int64_t CrossfadeFrames(int sample_rate, int crossfade_ms,
                               int64_t left_frames, int64_t right_frames) {
  if (crossfade_ms <= 0 || sample_rate <= 0) return 0;
  const int64_t nominal =
      static_cast<int64_t>(sample_rate) * crossfade_ms / 1000;
  return std::max<int64_t>(0, std::min({nominal, left_frames, right_frames}));
}

// Appends src to dst, overlapping the last fade_frames of dst with the first
// fade_frames of src under a linear ramp. Both buffers must share
// sample_rate and channels. fade_frames == 0 is plain concatenation.
inline void AppendWithCrossfade(PcmBuffer& dst, const PcmBuffer& src,
                                int64_t fade_frames) {
  if (dst.samples.empty()) {
    dst.sample_rate = src.sample_rate;
    dst.channels = src.channels;
    dst.samples = src.samples;
    return;
  }
  const int64_t n = std::min({fade_frames, dst.frames(), src.frames()});
  const size_t ch = static_cast<size_t>(dst.channels);
  const size_t overlap_start = dst.samples.size() - static_cast<size_t>(n) * ch;

  for (int64_t i = 0; i < n; ++i) {
    // w runs strictly inside (0, 1) so neither endpoint sample is dropped.
    const float w = static_cast<float>(i + 1) / static_cast<float>(n + 1);
    for (size_t c = 0; c < ch; ++c) {
      const size_t di = overlap_start + static_cast<size_t>(i) * ch + c;
      const size_t si = static_cast<size_t>(i) * ch + c;
      const float mixed = static_cast<float>(dst.samples[di]) * (1.0f - w) +
                          static_cast<float>(src.samples[si]) * w;
      dst.samples[di] = ClampToS16(mixed);
    }
  }
  dst.samples.insert(dst.samples.end(),
                     src.samples.begin() + static_cast<ptrdiff_t>(n * ch),
                     src.samples.end());
}

}  // namespace dialogcast::audio

#endif  // DIALOGCAST_AUDIO_PCM_OPS_HPP_
