// Repository: DialogCast
// Component: Audio Decoder
// Purpose: Decodes one in-memory audio container (MP3, WAV, ...) to
//          interleaved S16 PCM using libavformat/libavcodec.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_AUDIO_AUDIO_DECODER_HPP_
#define DIALOGCAST_AUDIO_AUDIO_DECODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "dialogcast/audio/PcmOps.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVIOContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace dialogcast::audio {

// AudioDecoder reads from a byte buffer through a custom AVIO context.
// Output keeps the stream's native sample rate and channel count; only the
// sample format is converted (to packed S16).
//
// Thread Safety: not thread-safe; one instance per buffer.
//
// Lifecycle:
// 1. Construct with the encoded bytes (must outlive the decoder)
// 2. Call Open()
// 3. Call DecodeAll()
// 4. Close() or rely on destructor
//
// Error Handling: returns false and records last_error().
class AudioDecoder {
 public:
  AudioDecoder(const std::vector<uint8_t>& bytes, std::string label);
  ~AudioDecoder();

  AudioDecoder(const AudioDecoder&) = delete;
  AudioDecoder& operator=(const AudioDecoder&) = delete;

  bool Open();

  // Decodes every audio frame and appends it to out (replacing its format).
  bool DecodeAll(PcmBuffer& out);

  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }
  const std::string& last_error() const { return last_error_; }

 private:
  static int ReadThunk(void* opaque, uint8_t* buf, int buf_size);
  static int64_t SeekThunk(void* opaque, int64_t offset, int whence);

  bool InitializeCodec();
  bool InitializeResampler();
  bool ReceiveFrames(PcmBuffer& out);
  bool ConvertFrame(AVFrame* frame, PcmBuffer& out);
  bool Fail(const std::string& step, int ret);

  const std::vector<uint8_t>& bytes_;
  std::string label_;
  int64_t read_pos_ = 0;

  AVIOContext* avio_ctx_ = nullptr;
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  int stream_index_ = -1;

  std::string last_error_;
};

// Wraps raw S16LE bytes as a PcmBuffer (no FFmpeg involved).
PcmBuffer PcmFromS16LE(const std::vector<uint8_t>& bytes, int sample_rate,
                       int channels);

// Human-readable FFmpeg error string.
std::string AvErrorString(int errnum);

}  // namespace dialogcast::audio

#endif  // DIALOGCAST_AUDIO_AUDIO_DECODER_HPP_
