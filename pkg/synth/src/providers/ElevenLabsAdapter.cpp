// Repository: DialogCast
// Component: ElevenLabsAdapter Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/providers/ElevenLabsAdapter.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <utility>

#include "dialogcast/usage/UsageTracker.hpp"
#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::providers {

using dialogcast::util::Logger;
using nlohmann::json;

namespace {

constexpr const char* kEmDash = "\xE2\x80\x94";

std::string ReplaceAll(std::string text, const std::string& from,
                       const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

}  // namespace

ElevenLabsAdapter::ElevenLabsAdapter(ElevenLabsConfig config,
                                     std::shared_ptr<IHttpTransport> transport,
                                     usage::UsageTracker* usage)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      usage_(usage),
      retry_(config_.retry) {
  if (config_.api_key.empty()) {
    throw ConfigError("[ElevenLabsAdapter] API key is empty");
  }
  if (!transport_) {
    throw ConfigError("[ElevenLabsAdapter] No HTTP transport");
  }
}

ProviderCapabilities ElevenLabsAdapter::Capabilities() const {
  ProviderCapabilities caps;
  caps.supports_quality_tiers = false;
  caps.native_sample_rate = config_.sample_rate;
  caps.supports_interruption_markup = true;
  return caps;
}

std::string ElevenLabsAdapter::ShapeText(const ProviderRequest& request) const {
  std::string text = ReplaceAll(request.segment.text, "--", kEmDash);
  tags::ProviderTags spoken;
  for (const auto& label : request.resolved_tags.labels) {
    if (label != config_.neutral_label) spoken.labels.push_back(label);
  }
  const std::string markup = spoken.ToInlineMarkup();
  if (markup.empty()) return text;
  return markup + " " + text;
}

std::string ElevenLabsAdapter::RequestPath() const {
  return "/v1/text-to-dialogue?output_format=pcm_" +
         std::to_string(config_.sample_rate);
}

std::string ElevenLabsAdapter::BuildBody(const ProviderRequest& request) const {
  json input;
  input["text"] = ShapeText(request);
  input["voice_id"] = request.voice_id;
  input["voice_settings"] = {{"speed", request.resolved_speed}};

  json body;
  body["inputs"] = json::array();
  body["inputs"].push_back(std::move(input));
  body["model_id"] = config_.model_id;
  return body.dump();
}

std::string ElevenLabsAdapter::DescribeRequest(
    const ProviderRequest& request) const {
  return json::parse(BuildBody(request)).dump(2);
}

AudioChunk ElevenLabsAdapter::Synthesize(const ProviderRequest& request,
                                         const CancellationToken& cancel) {
  const int32_t index = request.segment.index;
  const std::string name = ProviderName(Id());

  HttpRequest http;
  http.path = RequestPath();
  http.headers.emplace("xi-api-key", config_.api_key);
  http.headers.emplace("Accept", "application/octet-stream");
  http.body = BuildBody(request);

  {
    std::ostringstream oss;
    oss << "[ElevenLabsAdapter] segment " << index << " speaker "
        << script::SpeakerName(request.segment.speaker) << " speed "
        << request.resolved_speed << " tags '"
        << request.resolved_tags.ToInlineMarkup() << "'";
    Logger::Debug(oss.str());
  }

  HttpResponse response = retry_.Execute(
      name, index, cancel, [&] { return transport_->Post(http, cancel); });

  if (response.body.empty()) {
    throw SynthesisError(name, index, "empty audio body");
  }

  AudioChunk chunk;
  chunk.segment_index = index;
  chunk.sample_rate = config_.sample_rate;
  chunk.channels = 1;
  chunk.encoding = AudioEncoding::kPcmS16LE;
  chunk.bytes.assign(response.body.begin(), response.body.end());
  if (chunk.bytes.size() % 2 != 0) {
    Logger::Warn("[ElevenLabsAdapter] segment " + std::to_string(index) +
                 ": odd PCM byte count, dropping trailing byte");
    chunk.bytes.pop_back();
  }

  if (usage_) {
    usage_->Record(Id(), usage::UsageTracker::CountBilledUnits(ShapeText(request)));
  }
  return chunk;
}

}  // namespace dialogcast::providers
