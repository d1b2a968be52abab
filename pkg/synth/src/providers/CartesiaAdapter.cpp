// Repository: DialogCast
// Component: CartesiaAdapter Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/providers/CartesiaAdapter.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <utility>

#include "dialogcast/usage/UsageTracker.hpp"
#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::providers {

using dialogcast::util::Logger;
using nlohmann::json;

CartesiaAdapter::CartesiaAdapter(CartesiaConfig config,
                                 std::shared_ptr<IHttpTransport> transport,
                                 usage::UsageTracker* usage)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      usage_(usage),
      retry_(config_.retry) {
  if (config_.api_key.empty()) {
    throw ConfigError("[CartesiaAdapter] API key is empty");
  }
  if (!transport_) {
    throw ConfigError("[CartesiaAdapter] No HTTP transport");
  }
}

ProviderCapabilities CartesiaAdapter::Capabilities() const {
  ProviderCapabilities caps;
  caps.supports_quality_tiers = false;
  caps.native_sample_rate = config_.sample_rate;
  caps.supports_interruption_markup = false;
  return caps;
}

std::string CartesiaAdapter::BuildBody(const ProviderRequest& request) const {
  json controls;
  controls["speed"] = request.resolved_speed;
  json emotion = json::array();
  for (const auto& label : request.resolved_tags.labels) {
    if (label != config_.neutral_label) emotion.push_back(label);
  }
  if (!emotion.empty()) controls["emotion"] = std::move(emotion);

  json voice;
  voice["mode"] = "id";
  voice["id"] = request.voice_id;
  voice["__experimental_controls"] = std::move(controls);

  json body;
  body["model_id"] = config_.model_id;
  body["transcript"] = request.segment.text;
  body["voice"] = std::move(voice);
  body["output_format"] = {{"container", "mp3"},
                           {"encoding", "mp3"},
                           {"sample_rate", config_.sample_rate}};
  return body.dump();
}

std::string CartesiaAdapter::DescribeRequest(
    const ProviderRequest& request) const {
  return json::parse(BuildBody(request)).dump(2);
}

AudioChunk CartesiaAdapter::Synthesize(const ProviderRequest& request,
                                       const CancellationToken& cancel) {
  const int32_t index = request.segment.index;
  const std::string name = ProviderName(Id());

  HttpRequest http;
  http.path = "/tts/bytes";
  http.headers.emplace("X-API-Key", config_.api_key);
  http.headers.emplace("Cartesia-Version", config_.api_version);
  http.body = BuildBody(request);

  {
    std::ostringstream oss;
    oss << "[CartesiaAdapter] segment " << index << " speaker "
        << script::SpeakerName(request.segment.speaker) << " speed "
        << request.resolved_speed << " emotion '"
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
  chunk.encoding = AudioEncoding::kMp3;
  chunk.bytes.assign(response.body.begin(), response.body.end());

  if (usage_) {
    usage_->Record(Id(),
                   usage::UsageTracker::CountBilledUnits(request.segment.text));
  }
  return chunk;
}

}  // namespace dialogcast::providers
