// Repository: DialogCast
// Component: DialogueSynthesis gRPC service tests

#include <gtest/gtest.h>

#include <grpcpp/grpcpp.h>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "dialogcast/pipeline/DialoguePipeline.hpp"
#include "fixtures/ProviderAdapterStub.h"
#include "synthesis_service.h"

namespace dialogcast::service {
namespace {

using dialogcast::tests::fixtures::ProviderAdapterStub;
using dialogcast::tests::fixtures::StubFactory;
using providers::ProviderId;

constexpr char kScript[] =
    "Speaker A: [excited] Willkommen zurueck.\n"
    "Speaker B: Danke, schoen hier zu sein.\n"
    "Speaker A: Los geht's.\n";

pipeline::PipelineConfig ServiceConfig() {
  pipeline::PipelineConfig config = pipeline::PipelineConfig::Defaults();
  config.assembly.container = audio::OutputContainer::kWav;
  config.synthesis.max_concurrency = 2;
  config.providers[ProviderId::kCartesia].voices["german"] = {"ct-a", "ct-b"};
  config.providers[ProviderId::kElevenLabs].voices["german"] = {"el-a", "el-b"};
  return config;
}

class SynthesisServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    stub_ = std::make_shared<ProviderAdapterStub>(ProviderId::kCartesia, nullptr);
    pipeline_ = std::make_shared<pipeline::DialoguePipeline>(ServiceConfig(),
                                                             StubFactory(stub_));
    service_ = std::make_unique<DialogueSynthesisImpl>(pipeline_);
  }

  pb::RenderDialogueRequest BaseRequest() const {
    pb::RenderDialogueRequest request;
    request.set_script(kScript);
    request.set_provider("cartesia");
    request.set_language("de");
    request.set_tier("production");
    return request;
  }

  grpc::Status Render(const pb::RenderDialogueRequest& request,
                      pb::RenderDialogueResponse* response) {
    grpc::ServerContext context;
    return service_->RenderDialogue(&context, &request, response);
  }

  std::shared_ptr<ProviderAdapterStub> stub_;
  std::shared_ptr<pipeline::DialoguePipeline> pipeline_;
  std::unique_ptr<DialogueSynthesisImpl> service_;
};

TEST_F(SynthesisServiceTest, RendersAndReportsArtifactAndUsage) {
  pb::RenderDialogueRequest request = BaseRequest();
  request.set_return_audio(true);
  pb::RenderDialogueResponse response;

  const grpc::Status status = Render(request, &response);

  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_TRUE(response.success());
  EXPECT_EQ(response.segment_count(), 3);
  EXPECT_EQ(response.container(), "wav");
  EXPECT_GT(response.sample_rate(), 0);
  EXPECT_GT(response.duration_seconds(), 0.0);
  EXPECT_EQ(static_cast<int64_t>(response.audio().size()), response.byte_size());
  EXPECT_EQ(response.audio().substr(0, 4), "RIFF");
  EXPECT_TRUE(response.output_path().empty());
  ASSERT_EQ(response.usage_size(), 1);
  EXPECT_EQ(response.usage(0).provider(), "cartesia");
  EXPECT_EQ(response.usage(0).segment_count(), 3);
  EXPECT_GT(response.usage(0).units_billed(), 0);
}

TEST_F(SynthesisServiceTest, AudioOmittedUnlessRequested) {
  pb::RenderDialogueResponse response;
  ASSERT_TRUE(Render(BaseRequest(), &response).ok());
  EXPECT_TRUE(response.audio().empty());
  EXPECT_GT(response.byte_size(), 0);
}

TEST_F(SynthesisServiceTest, UnknownProviderIsInvalidArgument) {
  pb::RenderDialogueRequest request = BaseRequest();
  request.set_provider("acme-tts");
  pb::RenderDialogueResponse response;

  const grpc::Status status = Render(request, &response);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_FALSE(response.success());
  EXPECT_NE(response.message().find("acme-tts"), std::string::npos);
}

TEST_F(SynthesisServiceTest, UnknownTierIsInvalidArgument) {
  pb::RenderDialogueRequest request = BaseRequest();
  request.set_tier("ultra");
  pb::RenderDialogueResponse response;
  EXPECT_EQ(Render(request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(SynthesisServiceTest, MalformedScriptIsInvalidArgument) {
  pb::RenderDialogueRequest request = BaseRequest();
  request.set_script("Just some prose without any speaker labels.");
  pb::RenderDialogueResponse response;

  EXPECT_EQ(Render(request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_FALSE(response.success());
}

TEST_F(SynthesisServiceTest, TagOnlyScriptIsInvalidArgument) {
  pb::RenderDialogueRequest request = BaseRequest();
  request.set_script("Speaker A: [excited]\nSpeaker B: [curious]\n");
  pb::RenderDialogueResponse response;

  EXPECT_EQ(Render(request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_FALSE(response.success());
  EXPECT_TRUE(stub_->requests().empty());
}

TEST_F(SynthesisServiceTest, ProviderFailureIsUnavailable) {
  stub_->FailOn(1);
  pb::RenderDialogueResponse response;

  const grpc::Status status = Render(BaseRequest(), &response);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
  EXPECT_NE(response.message().find("voice not found"), std::string::npos);
}

TEST_F(SynthesisServiceTest, UnknownLanguageIsFailedPrecondition) {
  pb::RenderDialogueRequest request = BaseRequest();
  request.set_language("klingon");
  pb::RenderDialogueResponse response;
  EXPECT_EQ(Render(request, &response).error_code(),
            grpc::StatusCode::FAILED_PRECONDITION);
}

TEST(ResolveUnderRootTest, ConfinesClientPathsToTheRoot) {
  EXPECT_EQ(ResolveUnderRoot("/srv/out", "show/ep1.mp3").value_or(""),
            "/srv/out/show/ep1.mp3");
  EXPECT_EQ(ResolveUnderRoot("/srv/out", "a/../ep1.mp3").value_or(""),
            "/srv/out/ep1.mp3");
  EXPECT_FALSE(ResolveUnderRoot("/srv/out", "/etc/passwd").has_value());
  EXPECT_FALSE(ResolveUnderRoot("/srv/out", "../ep1.mp3").has_value());
  EXPECT_FALSE(ResolveUnderRoot("/srv/out", "a/../../ep1.mp3").has_value());
  EXPECT_FALSE(ResolveUnderRoot("/srv/out", "").has_value());
}

TEST_F(SynthesisServiceTest, OutputPathOutsideRootIsInvalidArgument) {
  for (const std::string path : {"/tmp/escape.wav", "../escape.wav"}) {
    pb::RenderDialogueRequest request = BaseRequest();
    request.set_output_path(path);
    pb::RenderDialogueResponse response;

    EXPECT_EQ(Render(request, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT)
        << path;
    EXPECT_FALSE(response.success());
  }
  EXPECT_TRUE(stub_->requests().empty());
}

TEST_F(SynthesisServiceTest, DebugDirOutsideRootIsInvalidArgument) {
  pb::RenderDialogueRequest request = BaseRequest();
  request.set_debug_dir("/var/tmp/dumps");
  pb::RenderDialogueResponse response;
  EXPECT_EQ(Render(request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_TRUE(stub_->requests().empty());
}

TEST_F(SynthesisServiceTest, RelativeOutputPathIsWrittenUnderRoot) {
  namespace fs = std::filesystem;
  const fs::path root = fs::temp_directory_path() /
                        ("dialogcast_service_root_" + std::to_string(getpid()));
  fs::remove_all(root);
  service_ = std::make_unique<DialogueSynthesisImpl>(pipeline_, root.string());

  pb::RenderDialogueRequest request = BaseRequest();
  request.set_output_path("episodes/ep1.wav");
  pb::RenderDialogueResponse response;

  const grpc::Status status = Render(request, &response);

  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.output_path(), (root / "episodes" / "ep1.wav").string());
  EXPECT_TRUE(fs::exists(root / "episodes" / "ep1.wav"));
  fs::remove_all(root);
}

TEST_F(SynthesisServiceTest, ServerReturnsOnceStopIsRequested) {
  std::atomic<bool> stop{false};
  ServerOptions options;
  options.address = "127.0.0.1:0";
  options.stop_requested = [&stop] { return stop.load(); };

  auto served = std::async(std::launch::async, [&options, this] {
    return RunSynthesisServer(options, pipeline_);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  stop.store(true);

  ASSERT_EQ(served.wait_for(std::chrono::seconds(10)), std::future_status::ready);
  EXPECT_TRUE(served.get());
}

TEST_F(SynthesisServiceTest, GetVersionReportsApiVersion) {
  grpc::ServerContext context;
  pb::ApiVersionRequest request;
  pb::ApiVersion response;
  ASSERT_TRUE(service_->GetVersion(&context, &request, &response).ok());
  EXPECT_EQ(response.version(), kApiVersion);
}

}  // namespace
}  // namespace dialogcast::service
