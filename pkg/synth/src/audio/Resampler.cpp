// Repository: DialogCast
// Component: Resampler Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/audio/Resampler.hpp"

#include <cstring>
#include <sstream>

#include "dialogcast/audio/AudioDecoder.hpp"
#include "dialogcast/util/Logger.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace dialogcast::audio {

using dialogcast::util::Logger;

namespace {

bool Fail(const std::string& msg, int ret, std::string* error) {
  std::string text = msg;
  if (ret < 0) text += " (" + AvErrorString(ret) + ")";
  Logger::Error("[Resampler] " + text);
  if (error) *error = text;
  return false;
}

}  // namespace

bool ResamplePcm(const PcmBuffer& in, int dst_rate, int dst_channels,
                 PcmBuffer& out, std::string* error) {
  if (in.sample_rate <= 0 || in.channels <= 0) {
    return Fail("invalid input format", 0, error);
  }
  if (dst_rate <= 0 || dst_channels <= 0) {
    return Fail("invalid output format", 0, error);
  }
  if (in.sample_rate == dst_rate && in.channels == dst_channels) {
    out = in;
    return true;
  }

  AVChannelLayout src_layout;
  AVChannelLayout dst_layout;
  std::memset(&src_layout, 0, sizeof(src_layout));
  std::memset(&dst_layout, 0, sizeof(dst_layout));
  av_channel_layout_default(&src_layout, in.channels);
  av_channel_layout_default(&dst_layout, dst_channels);

  SwrContext* swr = nullptr;
  int ret = swr_alloc_set_opts2(&swr, &dst_layout, AV_SAMPLE_FMT_S16, dst_rate,
                                &src_layout, AV_SAMPLE_FMT_S16, in.sample_rate,
                                0, nullptr);
  av_channel_layout_uninit(&src_layout);
  av_channel_layout_uninit(&dst_layout);
  if (ret < 0) {
    swr_free(&swr);
    return Fail("failed to set resampler options", ret, error);
  }
  ret = swr_init(swr);
  if (ret < 0) {
    swr_free(&swr);
    return Fail("failed to initialize resampler", ret, error);
  }

  const int in_frames = static_cast<int>(in.frames());
  const int64_t max_out =
      av_rescale_rnd(swr_get_delay(swr, in.sample_rate) + in_frames, dst_rate,
                     in.sample_rate, AV_ROUND_UP) +
      32;

  PcmBuffer result;
  result.sample_rate = dst_rate;
  result.channels = dst_channels;
  result.samples.resize(static_cast<size_t>(max_out) * dst_channels);

  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(result.samples.data())};
  const uint8_t* in_data[1] = {
      reinterpret_cast<const uint8_t*>(in.samples.data())};

  int converted = swr_convert(swr, out_data, static_cast<int>(max_out), in_data,
                              in_frames);
  if (converted < 0) {
    swr_free(&swr);
    return Fail("swr_convert failed", converted, error);
  }
  int64_t total = converted;

  // Flush the filter tail.
  while (total < max_out) {
    out_data[0] = reinterpret_cast<uint8_t*>(result.samples.data() +
                                             total * dst_channels);
    converted = swr_convert(swr, out_data, static_cast<int>(max_out - total),
                            nullptr, 0);
    if (converted < 0) {
      swr_free(&swr);
      return Fail("swr_convert flush failed", converted, error);
    }
    if (converted == 0) break;
    total += converted;
  }
  swr_free(&swr);

  result.samples.resize(static_cast<size_t>(total) * dst_channels);

  std::ostringstream oss;
  oss << "[Resampler] " << in.sample_rate << " Hz x" << in.channels << " -> "
      << dst_rate << " Hz x" << dst_channels << " (" << in_frames << " -> "
      << total << " frames)";
  Logger::Debug(oss.str());

  out = std::move(result);
  return true;
}

}  // namespace dialogcast::audio
