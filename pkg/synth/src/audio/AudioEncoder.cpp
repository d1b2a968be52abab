// Repository: DialogCast
// Component: Audio Encoder
// Purpose: PCM to MP3/WAV through libavcodec + libavformat into memory.
// Copyright (c) 2026 DialogCast

#include "dialogcast/audio/AudioEncoder.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

#include "dialogcast/audio/AudioDecoder.hpp"
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
// Frame size for encoders that accept any size (PCM).
constexpr int kDefaultFrameSize = 4096;

AVSampleFormat PickSampleFormat(const AVCodec* codec) {
  const AVSampleFormat* formats = nullptr;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(61, 13, 100)
  const void* configs = nullptr;
  int count = 0;
  if (avcodec_get_supported_config(nullptr, codec,
                                   AV_CODEC_CONFIG_SAMPLE_FORMAT, 0, &configs,
                                   &count) >= 0) {
    formats = static_cast<const AVSampleFormat*>(configs);
  }
#else
  formats = codec->sample_fmts;
#endif
  if (formats == nullptr) return AV_SAMPLE_FMT_S16;

  // Prefer S16 variants: no requantization.
  for (const AVSampleFormat* f = formats; *f != AV_SAMPLE_FMT_NONE; ++f) {
    if (*f == AV_SAMPLE_FMT_S16 || *f == AV_SAMPLE_FMT_S16P) return *f;
  }
  return formats[0];
}

}  // namespace

// Bridges FFmpeg's C callbacks to the encoder instance. The write callback's
// buffer became const in libavformat 61.
struct EncoderAvioCallbacks {
#if LIBAVFORMAT_VERSION_MAJOR < 61
  static int Write(void* opaque, uint8_t* buf, int buf_size) {
#else
  static int Write(void* opaque, const uint8_t* buf, int buf_size) {
#endif
    return static_cast<AudioEncoder*>(opaque)->HandleWrite(buf, buf_size);
  }

  static int64_t Seek(void* opaque, int64_t offset, int whence) {
    return static_cast<AudioEncoder*>(opaque)->HandleSeek(offset, whence);
  }
};

AudioEncoder::AudioEncoder(EncoderSettings settings) : settings_(settings) {}

AudioEncoder::~AudioEncoder() { Close(); }

int AudioEncoder::HandleWrite(const uint8_t* buf, int buf_size) {
  if (buf_size <= 0) return 0;
  const size_t end = static_cast<size_t>(write_pos_) + static_cast<size_t>(buf_size);
  if (sink_.size() < end) sink_.resize(end);
  std::memcpy(sink_.data() + write_pos_, buf, static_cast<size_t>(buf_size));
  write_pos_ += buf_size;
  return buf_size;
}

int64_t AudioEncoder::HandleSeek(int64_t offset, int whence) {
  const int64_t size = static_cast<int64_t>(sink_.size());
  if (whence & AVSEEK_SIZE) return size;
  int64_t target = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET:
      target = offset;
      break;
    case SEEK_CUR:
      target = write_pos_ + offset;
      break;
    case SEEK_END:
      target = size + offset;
      break;
    default:
      return AVERROR(EINVAL);
  }
  if (target < 0) return AVERROR(EINVAL);
  write_pos_ = target;
  return target;
}

bool AudioEncoder::Fail(const std::string& step, int ret) {
  std::ostringstream oss;
  oss << step;
  if (ret < 0) oss << " (" << AvErrorString(ret) << ")";
  last_error_ = oss.str();
  Logger::Error("[AudioEncoder] " + last_error_);
  return false;
}

bool AudioEncoder::Open(const PcmBuffer& pcm) {
  av_log_set_level(AV_LOG_ERROR);

  const char* muxer = settings_.container == OutputContainer::kMp3 ? "mp3" : "wav";
  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, muxer, nullptr);
  if (ret < 0 || !format_ctx_) return Fail("failed to allocate output context", ret);

  auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
  if (!buffer) return Fail("failed to allocate AVIO buffer", 0);
  avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 1, this, nullptr,
                                 &EncoderAvioCallbacks::Write,
                                 &EncoderAvioCallbacks::Seek);
  if (!avio_ctx_) {
    av_free(buffer);
    return Fail("failed to allocate AVIO context", 0);
  }
  // Seekable so the muxer can patch its header in av_write_trailer().
  avio_ctx_->seekable = AVIO_SEEKABLE_NORMAL;

  format_ctx_->pb = avio_ctx_;
  format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;
  format_ctx_->flags |= AVFMT_FLAG_BITEXACT;

  if (!OpenCodec(pcm)) return false;

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) return Fail("write_header failed", ret);
  return true;
}

bool AudioEncoder::OpenCodec(const PcmBuffer& pcm) {
  const AVCodec* codec = nullptr;
  if (settings_.container == OutputContainer::kMp3) {
    codec = avcodec_find_encoder_by_name("libmp3lame");
    if (!codec) {
      Logger::Warn("[AudioEncoder] libmp3lame unavailable, using default MP3 encoder");
      codec = avcodec_find_encoder(AV_CODEC_ID_MP3);
    }
  } else {
    codec = avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE);
  }
  if (!codec) return Fail(std::string("no encoder for ") +
                              ContainerExtension(settings_.container), 0);
  codec_name_ = codec->name;

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) return Fail("failed to allocate codec context", 0);

  codec_ctx_->sample_rate = pcm.sample_rate;
  av_channel_layout_default(&codec_ctx_->ch_layout, pcm.channels);
  codec_ctx_->sample_fmt = PickSampleFormat(codec);
  codec_ctx_->time_base = AVRational{1, pcm.sample_rate};
  codec_ctx_->flags |= AV_CODEC_FLAG_BITEXACT;
  if (settings_.container == OutputContainer::kMp3) {
    codec_ctx_->bit_rate = static_cast<int64_t>(settings_.bitrate_kbps) * 1000;
  }
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) return Fail("failed to open encoder " + codec_name_, ret);

  stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!stream_) return Fail("failed to create stream", 0);
  ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
  if (ret < 0) return Fail("failed to copy codec parameters", ret);
  stream_->time_base = codec_ctx_->time_base;

  // Packed S16 to encoder sample format, same rate and layout.
  ret = swr_alloc_set_opts2(&swr_ctx_, &codec_ctx_->ch_layout,
                            codec_ctx_->sample_fmt, pcm.sample_rate,
                            &codec_ctx_->ch_layout, AV_SAMPLE_FMT_S16,
                            pcm.sample_rate, 0, nullptr);
  if (ret < 0) return Fail("failed to set converter options", ret);
  ret = swr_init(swr_ctx_);
  if (ret < 0) return Fail("failed to initialize converter", ret);

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) return Fail("failed to allocate frame/packet", 0);
  return true;
}

bool AudioEncoder::DrainPackets() {
  while (true) {
    int ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) return Fail("receive_packet failed", ret);

    packet_->stream_index = stream_->index;
    av_packet_rescale_ts(packet_, codec_ctx_->time_base, stream_->time_base);
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) return Fail("write_frame failed", ret);
  }
}

bool AudioEncoder::SendFrames(const PcmBuffer& pcm) {
  const bool variable =
      (codec_ctx_->codec->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE) != 0;
  const bool small_last =
      (codec_ctx_->codec->capabilities & AV_CODEC_CAP_SMALL_LAST_FRAME) != 0;
  const int frame_size = (codec_ctx_->frame_size > 0 && !variable)
                             ? codec_ctx_->frame_size
                             : kDefaultFrameSize;
  const int channels = pcm.channels;
  const int64_t total = pcm.frames();

  std::vector<int16_t> tail;  // Zero-padded final frame when required
  for (int64_t offset = 0; offset < total; offset += frame_size) {
    int n = static_cast<int>(std::min<int64_t>(frame_size, total - offset));
    const int16_t* src = pcm.samples.data() + offset * channels;

    if (n < frame_size && !variable && !small_last) {
      tail.assign(static_cast<size_t>(frame_size) * channels, 0);
      std::copy(src, src + static_cast<size_t>(n) * channels, tail.begin());
      src = tail.data();
      n = frame_size;
    }

    frame_->nb_samples = n;
    frame_->format = codec_ctx_->sample_fmt;
    frame_->sample_rate = codec_ctx_->sample_rate;
    int ret = av_channel_layout_copy(&frame_->ch_layout, &codec_ctx_->ch_layout);
    if (ret < 0) return Fail("failed to copy channel layout", ret);
    ret = av_frame_get_buffer(frame_, 0);
    if (ret < 0) return Fail("failed to allocate frame buffer", ret);

    const uint8_t* in_data[1] = {reinterpret_cast<const uint8_t*>(src)};
    const int converted = swr_convert(swr_ctx_, frame_->extended_data, n, in_data, n);
    if (converted != n) {
      av_frame_unref(frame_);
      return Fail("sample conversion failed", converted);
    }

    frame_->pts = next_pts_;
    next_pts_ += n;

    ret = avcodec_send_frame(codec_ctx_, frame_);
    av_frame_unref(frame_);
    if (ret < 0) return Fail("send_frame failed", ret);
    if (!DrainPackets()) return false;
  }

  const int ret = avcodec_send_frame(codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) return Fail("encoder flush failed", ret);
  return DrainPackets();
}

bool AudioEncoder::Encode(const PcmBuffer& pcm, std::vector<uint8_t>& out) {
  Close();
  sink_.clear();
  write_pos_ = 0;
  next_pts_ = 0;
  last_error_.clear();

  if (pcm.sample_rate <= 0 || pcm.channels <= 0 || pcm.samples.empty()) {
    return Fail("empty or invalid PCM input", 0);
  }

  bool ok = Open(pcm) && SendFrames(pcm);
  if (ok) {
    const int ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      ok = Fail("write_trailer failed", ret);
    } else {
      avio_flush(avio_ctx_);
    }
  }
  Close();
  if (!ok) return false;

  std::ostringstream oss;
  oss << "[AudioEncoder] " << codec_name_ << " "
      << ContainerExtension(settings_.container) << " " << pcm.sample_rate
      << " Hz x" << pcm.channels << " -> " << sink_.size() << " bytes";
  Logger::Debug(oss.str());

  out = std::move(sink_);
  sink_.clear();
  return true;
}

void AudioEncoder::Close() {
  if (swr_ctx_) swr_free(&swr_ctx_);
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  if (format_ctx_) {
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  stream_ = nullptr;
  if (avio_ctx_) {
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  }
}

}  // namespace dialogcast::audio
