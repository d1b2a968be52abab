// Repository: DialogCast
// Component: Resampler
// Purpose: Sample-rate and channel-count conversion of S16 PCM via
//          libswresample.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_AUDIO_RESAMPLER_HPP_
#define DIALOGCAST_AUDIO_RESAMPLER_HPP_

#include <string>

#include "dialogcast/audio/PcmOps.hpp"

namespace dialogcast::audio {

// Converts `in` to dst_rate / dst_channels (default layouts), S16 packed.
// A matching input is copied unchanged. Returns false and fills *error on
// failure.
bool ResamplePcm(const PcmBuffer& in, int dst_rate, int dst_channels,
                 PcmBuffer& out, std::string* error = nullptr);

}  // namespace dialogcast::audio

#endif  // DIALOGCAST_AUDIO_RESAMPLER_HPP_
