// Repository: DialogCast
// Component: Audio Decoder
// Purpose: In-memory container decode via libavformat/libavcodec.
// Copyright (c) 2026 DialogCast

#include "dialogcast/audio/AudioDecoder.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

#include "dialogcast/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mem.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace dialogcast::audio {

using dialogcast::util::Logger;

namespace {

constexpr int kAvioBufferSize = 16 * 1024;

}  // namespace

std::string AvErrorString(int errnum) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(errnum, errbuf, sizeof(errbuf));
  return errbuf;
}

PcmBuffer PcmFromS16LE(const std::vector<uint8_t>& bytes, int sample_rate,
                       int channels) {
  PcmBuffer out;
  out.sample_rate = sample_rate;
  out.channels = channels;
  const size_t count = bytes.size() / 2;
  out.samples.resize(count);
  for (size_t i = 0; i < count; ++i) {
    const uint16_t lo = bytes[2 * i];
    const uint16_t hi = bytes[2 * i + 1];
    out.samples[i] = static_cast<int16_t>(lo | (hi << 8));
  }
  return out;
}

AudioDecoder::AudioDecoder(const std::vector<uint8_t>& bytes, std::string label)
    : bytes_(bytes), label_(std::move(label)) {}

AudioDecoder::~AudioDecoder() { Close(); }

int AudioDecoder::ReadThunk(void* opaque, uint8_t* buf, int buf_size) {
  auto* self = static_cast<AudioDecoder*>(opaque);
  const int64_t total = static_cast<int64_t>(self->bytes_.size());
  const int64_t remaining = total - self->read_pos_;
  if (remaining <= 0) return AVERROR_EOF;
  const int n = static_cast<int>(std::min<int64_t>(remaining, buf_size));
  std::memcpy(buf, self->bytes_.data() + self->read_pos_, static_cast<size_t>(n));
  self->read_pos_ += n;
  return n;
}

int64_t AudioDecoder::SeekThunk(void* opaque, int64_t offset, int whence) {
  auto* self = static_cast<AudioDecoder*>(opaque);
  const int64_t total = static_cast<int64_t>(self->bytes_.size());
  if (whence & AVSEEK_SIZE) return total;
  int64_t target = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET:
      target = offset;
      break;
    case SEEK_CUR:
      target = self->read_pos_ + offset;
      break;
    case SEEK_END:
      target = total + offset;
      break;
    default:
      return AVERROR(EINVAL);
  }
  if (target < 0 || target > total) return AVERROR(EINVAL);
  self->read_pos_ = target;
  return target;
}

bool AudioDecoder::Fail(const std::string& step, int ret) {
  std::ostringstream oss;
  oss << label_ << ": " << step;
  if (ret < 0) oss << " (" << AvErrorString(ret) << ")";
  last_error_ = oss.str();
  Logger::Error("[AudioDecoder] " + last_error_);
  return false;
}

bool AudioDecoder::Open() {
  if (bytes_.empty()) return Fail("empty input", 0);

  av_log_set_level(AV_LOG_ERROR);
  read_pos_ = 0;

  auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
  if (!buffer) return Fail("failed to allocate AVIO buffer", 0);
  avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 0, this,
                                 &AudioDecoder::ReadThunk, nullptr,
                                 &AudioDecoder::SeekThunk);
  if (!avio_ctx_) {
    av_free(buffer);
    return Fail("failed to allocate AVIO context", 0);
  }

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    Close();
    return Fail("failed to allocate format context", 0);
  }
  format_ctx_->pb = avio_ctx_;
  format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  // On failure avformat_open_input frees format_ctx_ and nulls it.
  int ret = avformat_open_input(&format_ctx_, nullptr, nullptr, nullptr);
  if (ret < 0) {
    Close();
    return Fail("open_input failed", ret);
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Close();
    return Fail("find_stream_info failed", ret);
  }

  stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1,
                                      nullptr, 0);
  if (stream_index_ < 0) {
    Close();
    return Fail("no audio stream", stream_index_);
  }

  if (!InitializeCodec() || !InitializeResampler()) {
    const std::string err = last_error_;
    Close();
    last_error_ = err;
    return false;
  }
  return true;
}

bool AudioDecoder::InitializeCodec() {
  AVCodecParameters* codecpar = format_ctx_->streams[stream_index_]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) return Fail("decoder not found", 0);

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) return Fail("failed to allocate codec context", 0);

  int ret = avcodec_parameters_to_context(codec_ctx_, codecpar);
  if (ret < 0) return Fail("failed to copy codec parameters", ret);

  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) return Fail("failed to open codec", ret);

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) return Fail("failed to allocate frame/packet", 0);
  return true;
}

bool AudioDecoder::InitializeResampler() {
  AVChannelLayout src_layout;
  std::memset(&src_layout, 0, sizeof(src_layout));
  if (codec_ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC ||
      codec_ctx_->ch_layout.nb_channels <= 0) {
    const int channels = codec_ctx_->ch_layout.nb_channels > 0
                             ? codec_ctx_->ch_layout.nb_channels
                             : 1;
    av_channel_layout_default(&src_layout, channels);
  } else if (av_channel_layout_copy(&src_layout, &codec_ctx_->ch_layout) < 0) {
    return Fail("failed to copy source channel layout", 0);
  }

  // Same rate and layout; sample format only.
  AVChannelLayout dst_layout;
  std::memset(&dst_layout, 0, sizeof(dst_layout));
  av_channel_layout_default(&dst_layout, src_layout.nb_channels);

  int ret = swr_alloc_set_opts2(&swr_ctx_, &dst_layout, AV_SAMPLE_FMT_S16,
                                codec_ctx_->sample_rate, &src_layout,
                                codec_ctx_->sample_fmt, codec_ctx_->sample_rate,
                                0, nullptr);
  av_channel_layout_uninit(&src_layout);
  av_channel_layout_uninit(&dst_layout);
  if (ret < 0) return Fail("failed to set resampler options", ret);

  ret = swr_init(swr_ctx_);
  if (ret < 0) return Fail("failed to initialize resampler", ret);
  return true;
}

bool AudioDecoder::ConvertFrame(AVFrame* frame, PcmBuffer& out) {
  const int channels = out.channels;
  const int max_out = swr_get_out_samples(swr_ctx_, frame ? frame->nb_samples : 0);
  if (max_out < 0) return Fail("swr_get_out_samples failed", max_out);
  if (max_out == 0) return true;

  const size_t old_size = out.samples.size();
  out.samples.resize(old_size + static_cast<size_t>(max_out) * channels);
  uint8_t* out_data[1] = {
      reinterpret_cast<uint8_t*>(out.samples.data() + old_size)};

  const int converted = swr_convert(
      swr_ctx_, out_data, max_out,
      frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
      frame ? frame->nb_samples : 0);
  if (converted < 0) {
    out.samples.resize(old_size);
    return Fail("audio conversion failed", converted);
  }
  out.samples.resize(old_size + static_cast<size_t>(converted) * channels);
  return true;
}

bool AudioDecoder::ReceiveFrames(PcmBuffer& out) {
  while (true) {
    const int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) return Fail("receive_frame failed", ret);
    const bool ok = ConvertFrame(frame_, out);
    av_frame_unref(frame_);
    if (!ok) return false;
  }
}

bool AudioDecoder::DecodeAll(PcmBuffer& out) {
  if (!IsOpen()) return Fail("decoder not open", 0);

  out.samples.clear();
  out.sample_rate = codec_ctx_->sample_rate;
  out.channels = codec_ctx_->ch_layout.nb_channels > 0
                     ? codec_ctx_->ch_layout.nb_channels
                     : 1;

  while (true) {
    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) break;
    if (ret < 0) return Fail("read_frame failed", ret);

    if (packet_->stream_index != stream_index_) {
      av_packet_unref(packet_);
      continue;
    }
    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    // A corrupt packet is skipped, matching ffmpeg's default tolerance.
    if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_INVALIDDATA) {
      return Fail("send_packet failed", ret);
    }
    if (!ReceiveFrames(out)) return false;
  }

  // Drain decoder, then resampler.
  const int ret = avcodec_send_packet(codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) return Fail("decoder flush failed", ret);
  if (!ReceiveFrames(out)) return false;
  if (!ConvertFrame(nullptr, out)) return false;

  if (out.samples.empty()) return Fail("decoded no samples", 0);

  std::ostringstream oss;
  oss << "[AudioDecoder] " << label_ << ": " << out.frames() << " frames @ "
      << out.sample_rate << " Hz x" << out.channels;
  Logger::Debug(oss.str());
  return true;
}

void AudioDecoder::Close() {
  if (swr_ctx_) swr_free(&swr_ctx_);
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  if (format_ctx_) avformat_close_input(&format_ctx_);
  // Custom IO: the format context never owns avio_ctx_.
  if (avio_ctx_) {
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  }
  stream_index_ = -1;
}

}  // namespace dialogcast::audio
