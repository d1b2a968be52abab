// Repository: DialogCast
// Component: Provider adapter tests (scripted transport, no network)

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <memory>
#include <string>

#include "dialogcast/providers/CartesiaAdapter.hpp"
#include "dialogcast/providers/ElevenLabsAdapter.hpp"
#include "dialogcast/providers/ProviderFactory.hpp"
#include "dialogcast/usage/UsageTracker.hpp"
#include "dialogcast/util/Errors.hpp"
#include "fixtures/HttpTransportStub.h"

namespace dialogcast::providers {
namespace {

using dialogcast::tests::fixtures::HttpTransportStub;
using nlohmann::json;

RetryConfig FastRetry() {
  RetryConfig config;
  config.max_attempts = 3;
  config.initial_backoff = std::chrono::milliseconds(1);
  config.max_backoff = std::chrono::milliseconds(2);
  return config;
}

ProviderRequest MakeRequest(int32_t index, const std::string& text,
                            std::vector<std::string> labels, double speed) {
  ProviderRequest request;
  request.segment.index = index;
  request.segment.speaker = script::Speaker::kA;
  request.segment.text = text;
  request.resolved_tags.labels = std::move(labels);
  request.resolved_speed = speed;
  request.voice_id = "voice-a";
  return request;
}

std::string HeaderValue(const HttpRequest& request, const std::string& name) {
  auto it = request.headers.find(name);
  return it == request.headers.end() ? "" : it->second;
}

// -----------------------------------------------------------------------------
// ElevenLabs
// -----------------------------------------------------------------------------

TEST(ElevenLabsAdapterTest, SendsDialogueRequestAndReturnsPcm) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(200, std::string("\x01\x00\x02\x00", 4));
  usage::UsageTracker usage;

  ElevenLabsConfig config;
  config.api_key = "el-key";
  config.retry = FastRetry();
  ElevenLabsAdapter adapter(config, transport, &usage);

  CancellationToken cancel;
  const AudioChunk chunk = adapter.Synthesize(
      MakeRequest(3, "Hello -- there", {"excited"}, 1.05), cancel);

  EXPECT_EQ(chunk.segment_index, 3);
  EXPECT_EQ(chunk.encoding, AudioEncoding::kPcmS16LE);
  EXPECT_EQ(chunk.sample_rate, 24000);
  EXPECT_EQ(chunk.bytes.size(), 4u);

  const auto requests = transport->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].path, "/v1/text-to-dialogue?output_format=pcm_24000");
  EXPECT_EQ(HeaderValue(requests[0], "xi-api-key"), "el-key");

  const json body = json::parse(requests[0].body);
  EXPECT_EQ(body["model_id"], "eleven_v3");
  ASSERT_EQ(body["inputs"].size(), 1u);
  EXPECT_EQ(body["inputs"][0]["text"], "[excited] Hello \xE2\x80\x94 there");
  EXPECT_EQ(body["inputs"][0]["voice_id"], "voice-a");
  EXPECT_DOUBLE_EQ(body["inputs"][0]["voice_settings"]["speed"].get<double>(), 1.05);

  const auto summary = usage.Summary();
  EXPECT_EQ(summary.per_provider.at(ProviderId::kElevenLabs).segment_count, 1);
  EXPECT_EQ(summary.per_provider.at(ProviderId::kElevenLabs).units_billed,
            usage::UsageTracker::CountBilledUnits("[excited] Hello \xE2\x80\x94 there"));
}

TEST(ElevenLabsAdapterTest, NeutralFallbackIsNotSpoken) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(200, std::string("\x01\x00", 2));
  transport->Enqueue(200, std::string("\x01\x00", 2));
  ElevenLabsConfig config;
  config.api_key = "k";
  ElevenLabsAdapter adapter(config, transport, nullptr);

  CancellationToken cancel;
  adapter.Synthesize(MakeRequest(0, "Hi", {"neutral"}, 1.0), cancel);
  adapter.Synthesize(MakeRequest(1, "Hi", {"neutral", "curious"}, 1.0), cancel);

  const json first = json::parse(transport->requests().at(0).body);
  const json second = json::parse(transport->requests().at(1).body);
  EXPECT_EQ(first["inputs"][0]["text"], "Hi");
  EXPECT_EQ(second["inputs"][0]["text"], "[curious] Hi");
}

TEST(ElevenLabsAdapterTest, OddTrailingByteIsDropped) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(200, std::string("\x01\x00\x02", 3));
  ElevenLabsConfig config;
  config.api_key = "k";
  ElevenLabsAdapter adapter(config, transport, nullptr);

  CancellationToken cancel;
  EXPECT_EQ(adapter.Synthesize(MakeRequest(0, "Hi", {}, 1.0), cancel).bytes.size(), 2u);
}

TEST(ElevenLabsAdapterTest, EmptyKeyIsConfigError) {
  EXPECT_THROW(ElevenLabsAdapter(ElevenLabsConfig(),
                                 std::make_shared<HttpTransportStub>(), nullptr),
               ConfigError);
}

TEST(ElevenLabsAdapterTest, RetriesRateLimitThenSucceeds) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(429, "slow down");
  transport->Enqueue(200, std::string("\x00\x00", 2));
  usage::UsageTracker usage;
  ElevenLabsConfig config;
  config.api_key = "k";
  config.retry = FastRetry();
  ElevenLabsAdapter adapter(config, transport, &usage);

  CancellationToken cancel;
  adapter.Synthesize(MakeRequest(0, "Hi", {}, 1.0), cancel);

  EXPECT_EQ(transport->call_count(), 2u);
  // Billed once, for the successful call only.
  EXPECT_EQ(usage.Summary().total_segments, 1);
}

TEST(ElevenLabsAdapterTest, EmptyAudioBodyIsSynthesisError) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(200, "");
  usage::UsageTracker usage;
  ElevenLabsConfig config;
  config.api_key = "k";
  ElevenLabsAdapter adapter(config, transport, &usage);

  CancellationToken cancel;
  EXPECT_THROW(adapter.Synthesize(MakeRequest(0, "Hi", {}, 1.0), cancel),
               SynthesisError);
  EXPECT_EQ(usage.Summary().total_segments, 0);
}

// -----------------------------------------------------------------------------
// Cartesia
// -----------------------------------------------------------------------------

TEST(CartesiaAdapterTest, SendsBytesRequestWithEmotionControl) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(200, "ID3-mp3-bytes");
  usage::UsageTracker usage;

  CartesiaConfig config;
  config.api_key = "ct-key";
  config.retry = FastRetry();
  CartesiaAdapter adapter(config, transport, &usage);

  CancellationToken cancel;
  const AudioChunk chunk =
      adapter.Synthesize(MakeRequest(1, "Really?", {"curiosity:high"}, 0.1), cancel);

  EXPECT_EQ(chunk.encoding, AudioEncoding::kMp3);
  EXPECT_EQ(chunk.sample_rate, 44100);
  EXPECT_EQ(chunk.segment_index, 1);

  const auto requests = transport->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].path, "/tts/bytes");
  EXPECT_EQ(HeaderValue(requests[0], "X-API-Key"), "ct-key");
  EXPECT_EQ(HeaderValue(requests[0], "Cartesia-Version"), "2024-06-10");

  const json body = json::parse(requests[0].body);
  EXPECT_EQ(body["model_id"], "sonic-english");
  EXPECT_EQ(body["transcript"], "Really?");
  EXPECT_EQ(body["voice"]["mode"], "id");
  EXPECT_EQ(body["voice"]["id"], "voice-a");
  EXPECT_NEAR(body["voice"]["__experimental_controls"]["speed"].get<double>(), 0.1, 1e-9);
  EXPECT_EQ(body["voice"]["__experimental_controls"]["emotion"],
            json::array({"curiosity:high"}));
  EXPECT_EQ(body["output_format"]["container"], "mp3");
  EXPECT_EQ(body["output_format"]["sample_rate"], 44100);

  EXPECT_EQ(usage.Summary().per_provider.at(ProviderId::kCartesia).units_billed, 7);
}

TEST(CartesiaAdapterTest, NeutralLabelIsNotSent) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(200, "mp3");
  CartesiaConfig config;
  config.api_key = "k";
  CartesiaAdapter adapter(config, transport, nullptr);

  CancellationToken cancel;
  adapter.Synthesize(MakeRequest(0, "Hi", {"neutral"}, 0.0), cancel);

  const json body = json::parse(transport->requests().at(0).body);
  EXPECT_FALSE(body["voice"]["__experimental_controls"].contains("emotion"));
}

TEST(CartesiaAdapterTest, PermanentFailureCarriesSegmentAndProvider) {
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(400, "{\"error\":\"voice not found\"}");
  CartesiaConfig config;
  config.api_key = "k";
  config.retry = FastRetry();
  CartesiaAdapter adapter(config, transport, nullptr);

  CancellationToken cancel;
  try {
    adapter.Synthesize(MakeRequest(5, "Hi", {}, 0.0), cancel);
    FAIL() << "expected SynthesisError";
  } catch (const SynthesisError& e) {
    EXPECT_EQ(e.provider(), "cartesia");
    EXPECT_EQ(e.segment_index(), 5);
    EXPECT_NE(e.reason().find("HTTP 400"), std::string::npos);
  }
  EXPECT_EQ(transport->call_count(), 1u);
}

TEST(CartesiaAdapterTest, CancelledRunDoesNotRetry) {
  auto transport = std::make_shared<HttpTransportStub>();
  CartesiaConfig config;
  config.api_key = "k";
  config.retry = FastRetry();
  CartesiaAdapter adapter(config, transport, nullptr);

  CancellationToken cancel;
  cancel.Cancel();
  EXPECT_THROW(adapter.Synthesize(MakeRequest(0, "Hi", {}, 0.0), cancel),
               CancelledError);
  EXPECT_EQ(transport->call_count(), 0u);
}

// -----------------------------------------------------------------------------
// Factory
// -----------------------------------------------------------------------------

TEST(ProviderFactoryTest, MissingKeyNamesEnvironmentVariable) {
  ProviderSettings settings;
  settings.api_key_env = "DIALOGCAST_TEST_UNSET_KEY";
  ::unsetenv("DIALOGCAST_TEST_UNSET_KEY");
  try {
    ResolveApiKey(ProviderId::kCartesia, settings);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("DIALOGCAST_TEST_UNSET_KEY"),
              std::string::npos);
  }
}

TEST(ProviderFactoryTest, KeyFromEnvironment) {
  ::setenv("DIALOGCAST_TEST_KEY", "from-env", 1);
  ProviderSettings settings;
  settings.api_key_env = "DIALOGCAST_TEST_KEY";
  EXPECT_EQ(ResolveApiKey(ProviderId::kElevenLabs, settings), "from-env");
  ::unsetenv("DIALOGCAST_TEST_KEY");
}

TEST(ProviderFactoryTest, BuildsAdapterForEachProvider) {
  ProviderSettings settings;
  settings.api_key = "explicit";
  auto transport = std::make_shared<HttpTransportStub>();

  auto eleven = CreateProviderAdapter(ProviderId::kElevenLabs, settings, RetryConfig(),
                                      transport, nullptr);
  auto cartesia = CreateProviderAdapter(ProviderId::kCartesia, settings, RetryConfig(),
                                        transport, nullptr);
  EXPECT_EQ(eleven->Id(), ProviderId::kElevenLabs);
  EXPECT_EQ(cartesia->Id(), ProviderId::kCartesia);
  EXPECT_TRUE(eleven->Capabilities().supports_interruption_markup);
  EXPECT_EQ(cartesia->Capabilities().native_sample_rate, 44100);
}

TEST(ProviderFactoryTest, ConfiguredNeutralLabelIsWithheldFromCartesia) {
  ProviderSettings settings;
  settings.api_key = "explicit";
  settings.neutral_label = "calm";
  auto transport = std::make_shared<HttpTransportStub>();
  transport->Enqueue(200, "mp3");
  transport->Enqueue(200, "mp3");
  auto adapter = CreateProviderAdapter(ProviderId::kCartesia, settings, FastRetry(),
                                       transport, nullptr);

  CancellationToken cancel;
  adapter->Synthesize(MakeRequest(0, "Hi", {"calm"}, 0.0), cancel);
  adapter->Synthesize(MakeRequest(1, "Hi", {"neutral"}, 0.0), cancel);

  const json first = json::parse(transport->requests().at(0).body);
  const json second = json::parse(transport->requests().at(1).body);
  EXPECT_FALSE(first["voice"]["__experimental_controls"].contains("emotion"));
  EXPECT_EQ(second["voice"]["__experimental_controls"]["emotion"],
            json::array({"neutral"}));
}

}  // namespace
}  // namespace dialogcast::providers
