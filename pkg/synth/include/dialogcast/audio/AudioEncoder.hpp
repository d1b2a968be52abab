// Repository: DialogCast
// Component: Audio Encoder
// Purpose: Encodes S16 PCM into an MP3 or WAV container held in memory.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_AUDIO_AUDIO_ENCODER_HPP_
#define DIALOGCAST_AUDIO_AUDIO_ENCODER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dialogcast/audio/PcmOps.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVIOContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace dialogcast::audio {

enum class OutputContainer { kMp3, kWav };

inline const char* ContainerExtension(OutputContainer container) {
  return container == OutputContainer::kMp3 ? "mp3" : "wav";
}

inline std::optional<OutputContainer> ParseOutputContainer(const std::string& value) {
  if (value == "mp3") return OutputContainer::kMp3;
  if (value == "wav") return OutputContainer::kWav;
  return std::nullopt;
}

struct EncoderSettings {
  OutputContainer container = OutputContainer::kMp3;
  int bitrate_kbps = 192;  // Ignored for WAV
};

// AudioEncoder muxes into a seekable in-memory AVIO context so that
// containers which rewrite their header on close (WAV sizes, MP3 Xing/Info
// frame) produce a complete file. Output is bit-exact for identical input.
//
// MP3 prefers libmp3lame and falls back to whatever encoder FFmpeg registers
// for AV_CODEC_ID_MP3. WAV is pcm_s16le.
//
// Not thread-safe; one Encode() per instance.
class AudioEncoder {
 public:
  explicit AudioEncoder(EncoderSettings settings);
  ~AudioEncoder();

  AudioEncoder(const AudioEncoder&) = delete;
  AudioEncoder& operator=(const AudioEncoder&) = delete;

  // Returns false and records last_error() on failure.
  bool Encode(const PcmBuffer& pcm, std::vector<uint8_t>& out);

  // Name of the codec actually used by the last Encode() ("libmp3lame").
  const std::string& codec_name() const { return codec_name_; }
  const std::string& last_error() const { return last_error_; }

 private:
  // AVIO write/seek thunks; defined next to the FFmpeg includes.
  friend struct EncoderAvioCallbacks;

  int HandleWrite(const uint8_t* buf, int buf_size);
  int64_t HandleSeek(int64_t offset, int whence);

  bool Open(const PcmBuffer& pcm);
  bool OpenCodec(const PcmBuffer& pcm);
  bool SendFrames(const PcmBuffer& pcm);
  bool DrainPackets();
  void Close();
  bool Fail(const std::string& step, int ret);

  EncoderSettings settings_;

  std::vector<uint8_t> sink_;
  int64_t write_pos_ = 0;

  AVIOContext* avio_ctx_ = nullptr;
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVStream* stream_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  int64_t next_pts_ = 0;

  std::string codec_name_;
  std::string last_error_;
};

}  // namespace dialogcast::audio

#endif  // DIALOGCAST_AUDIO_AUDIO_ENCODER_HPP_
