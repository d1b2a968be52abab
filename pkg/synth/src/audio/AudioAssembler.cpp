// Repository: DialogCast
// Component: AudioAssembler Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/audio/AudioAssembler.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "dialogcast/audio/AudioDecoder.hpp"
#include "dialogcast/audio/Resampler.hpp"
#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::audio {

using dialogcast::util::Logger;
using providers::AudioChunk;
using providers::AudioEncoding;
using providers::QualityTier;

AudioAssembler::AudioAssembler(AssemblerConfig config) : config_(config) {}

void AudioAssembler::OrderAndValidate(std::vector<AudioChunk>& chunks) {
  if (chunks.empty()) {
    throw AssemblyError("[AudioAssembler] No audio chunks to assemble");
  }
  std::stable_sort(chunks.begin(), chunks.end(),
                   [](const AudioChunk& a, const AudioChunk& b) {
                     return a.segment_index < b.segment_index;
                   });
  for (size_t i = 0; i < chunks.size(); ++i) {
    const int32_t expected = static_cast<int32_t>(i);
    const int32_t actual = chunks[i].segment_index;
    if (actual == expected) continue;
    std::ostringstream oss;
    oss << "[AudioAssembler] ";
    if (i > 0 && actual == chunks[i - 1].segment_index) {
      oss << "Duplicate chunk for segment " << actual;
    } else {
      oss << "Missing chunk for segment " << expected << " (next is "
          << actual << ")";
    }
    throw AssemblyError(oss.str());
  }
}

PcmBuffer AudioAssembler::DecodeChunk(const AudioChunk& chunk) {
  const std::string label = "segment " + std::to_string(chunk.segment_index);
  if (chunk.bytes.empty()) {
    throw AssemblyError("[AudioAssembler] " + label + ": empty audio");
  }

  if (chunk.encoding == AudioEncoding::kPcmS16LE) {
    if (chunk.sample_rate <= 0 || chunk.channels <= 0) {
      throw AssemblyError("[AudioAssembler] " + label +
                          ": raw PCM without sample rate/channels");
    }
    return PcmFromS16LE(chunk.bytes, chunk.sample_rate, chunk.channels);
  }

  AudioDecoder decoder(chunk.bytes, label);
  PcmBuffer pcm;
  if (!decoder.Open() || !decoder.DecodeAll(pcm)) {
    throw AssemblyError("[AudioAssembler] Decode failed: " + decoder.last_error());
  }
  return pcm;
}

PcmBuffer AudioAssembler::Mix(std::vector<AudioChunk> chunks) const {
  OrderAndValidate(chunks);

  std::vector<PcmBuffer> decoded;
  decoded.reserve(chunks.size());
  for (auto& chunk : chunks) {
    decoded.push_back(DecodeChunk(chunk));
    // Encoded bytes are no longer needed once decoded.
    std::vector<uint8_t>().swap(chunk.bytes);
  }

  int rate = config_.target_sample_rate;
  int channels = config_.target_channels;
  for (const auto& pcm : decoded) {
    if (config_.target_sample_rate <= 0) rate = std::max(rate, pcm.sample_rate);
    if (config_.target_channels <= 0) channels = std::max(channels, pcm.channels);
  }

  PcmBuffer mix;
  mix.sample_rate = rate;
  mix.channels = channels;
  for (size_t i = 0; i < decoded.size(); ++i) {
    PcmBuffer uniform;
    std::string error;
    if (!ResamplePcm(decoded[i], rate, channels, uniform, &error)) {
      throw AssemblyError("[AudioAssembler] Cannot convert segment " +
                          std::to_string(i) + " to " + std::to_string(rate) +
                          " Hz x" + std::to_string(channels) + ": " + error);
    }
    std::vector<int16_t>().swap(decoded[i].samples);

    const int64_t fade = CrossfadeFrames(rate, config_.crossfade_ms,
                                         mix.frames(), uniform.frames());
    AppendWithCrossfade(mix, uniform, mix.samples.empty() ? 0 : fade);
  }
  return mix;
}

AssembledAudio AudioAssembler::Assemble(std::vector<AudioChunk> chunks,
                                        QualityTier tier) const {
  const size_t chunk_count = chunks.size();
  PcmBuffer mix = Mix(std::move(chunks));

  EncoderSettings settings;
  settings.container = config_.container;
  settings.bitrate_kbps = config_.production_bitrate_kbps;

  if (tier == QualityTier::kPrototype) {
    settings.bitrate_kbps = config_.prototype_bitrate_kbps;
    if (config_.prototype_sample_rate > 0 &&
        mix.sample_rate > config_.prototype_sample_rate) {
      PcmBuffer reduced;
      std::string error;
      if (!ResamplePcm(mix, config_.prototype_sample_rate, mix.channels,
                       reduced, &error)) {
        throw AssemblyError("[AudioAssembler] Prototype downsample failed: " +
                            error);
      }
      mix = std::move(reduced);
    }
  }

  AudioEncoder encoder(settings);
  AssembledAudio out;
  if (!encoder.Encode(mix, out.bytes)) {
    throw AssemblyError("[AudioAssembler] Encode failed: " +
                        encoder.last_error());
  }
  out.container = config_.container;
  out.sample_rate = mix.sample_rate;
  out.channels = mix.channels;
  out.duration_seconds = mix.DurationSeconds();
  out.byte_size = out.bytes.size();

  std::ostringstream oss;
  oss << "[AudioAssembler] " << chunk_count << " chunks -> "
      << ContainerExtension(out.container) << " " << out.sample_rate << " Hz x"
      << out.channels << " " << std::fixed << std::setprecision(2)
      << out.duration_seconds << " s, " << out.byte_size << " bytes ("
      << providers::QualityTierName(tier) << ")";
  Logger::Info(oss.str());
  return out;
}

}  // namespace dialogcast::audio
