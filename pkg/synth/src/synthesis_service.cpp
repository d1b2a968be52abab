// Repository: DialogCast
// Component: DialogueSynthesis gRPC Service Implementation
// Purpose: Maps RPC requests onto pipeline runs and pipeline errors onto
//          gRPC status codes.
// Copyright (c) 2026 DialogCast

#include "synthesis_service.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <utility>

#include "dialogcast/audio/AudioEncoder.hpp"
#include "dialogcast/providers/ProviderId.hpp"
#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::service {

using dialogcast::util::Logger;

namespace {

grpc::Status Fail(pb::RenderDialogueResponse* response, grpc::StatusCode code,
                  const std::string& message) {
  response->set_success(false);
  response->set_message(message);
  return grpc::Status(code, message);
}

constexpr auto kStopPollInterval = std::chrono::milliseconds(100);

}  // namespace

std::optional<std::string> ResolveUnderRoot(const std::string& output_root,
                                            const std::string& requested) {
  namespace fs = std::filesystem;
  const fs::path relative(requested);
  if (relative.empty() || relative.has_root_path()) return std::nullopt;
  const fs::path normal = relative.lexically_normal();
  if (normal.empty() || *normal.begin() == "..") return std::nullopt;
  return (fs::path(output_root) / normal).lexically_normal().string();
}

DialogueSynthesisImpl::DialogueSynthesisImpl(
    std::shared_ptr<pipeline::DialoguePipeline> pipeline, std::string output_root)
    : pipeline_(std::move(pipeline)), output_root_(std::move(output_root)) {
  Logger::Info(std::string("[DialogueSynthesisImpl] Service initialized (API version: ") +
               kApiVersion + ")");
}

DialogueSynthesisImpl::~DialogueSynthesisImpl() {
  Logger::Info("[DialogueSynthesisImpl] Service shutting down");
}

grpc::Status DialogueSynthesisImpl::RenderDialogue(
    grpc::ServerContext* context, const pb::RenderDialogueRequest* request,
    pb::RenderDialogueResponse* response) {
  (void)context;
  Logger::Info("[RenderDialogue] Request received: provider=" + request->provider() +
               ", language=" + request->language() + ", tier=" + request->tier() +
               ", script_bytes=" + std::to_string(request->script().size()));

  auto provider = providers::ParseProviderId(request->provider());
  if (!provider) {
    return Fail(response, grpc::StatusCode::INVALID_ARGUMENT,
                "Unknown provider: " + request->provider());
  }
  providers::QualityTier tier = providers::QualityTier::kPrototype;
  if (!request->tier().empty()) {
    auto parsed = providers::ParseQualityTier(request->tier());
    if (!parsed) {
      return Fail(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "Unknown tier: " + request->tier());
    }
    tier = *parsed;
  }

  pipeline::RunRequest run;
  run.script = request->script();
  run.provider = *provider;
  if (!request->language().empty()) run.language = request->language();
  if (request->user_speed() > 0.0) run.user_speed = request->user_speed();
  run.tier = tier;
  if (!request->output_path().empty()) {
    run.output_path = ResolveUnderRoot(output_root_, request->output_path());
    if (!run.output_path) {
      return Fail(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "output_path must be relative to the output root: " +
                      request->output_path());
    }
  }
  if (!request->debug_dir().empty()) {
    run.debug_dir = ResolveUnderRoot(output_root_, request->debug_dir());
    if (!run.debug_dir) {
      return Fail(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "debug_dir must be relative to the output root: " +
                      request->debug_dir());
    }
  }
  if (request->speaker_a_speed() > 0.0) run.speaker_a_speed = request->speaker_a_speed();
  if (request->speaker_b_speed() > 0.0) run.speaker_b_speed = request->speaker_b_speed();

  pipeline::RunResult result;
  try {
    result = pipeline_->Run(run);
  } catch (const MalformedScriptError& e) {
    return Fail(response, grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const SynthesisError& e) {
    return Fail(response, grpc::StatusCode::UNAVAILABLE, e.what());
  } catch (const AssemblyError& e) {
    return Fail(response, grpc::StatusCode::INTERNAL, e.what());
  } catch (const ConfigError& e) {
    return Fail(response, grpc::StatusCode::FAILED_PRECONDITION, e.what());
  } catch (const CancelledError& e) {
    return Fail(response, grpc::StatusCode::CANCELLED, e.what());
  } catch (const std::exception& e) {
    return Fail(response, grpc::StatusCode::INTERNAL, e.what());
  }

  response->set_success(true);
  response->set_message("rendered " + std::to_string(result.segment_count) +
                        " segments");
  if (request->return_audio()) {
    response->set_audio(result.audio.bytes.data(), result.audio.bytes.size());
  }
  response->set_container(audio::ContainerExtension(result.audio.container));
  response->set_sample_rate(result.audio.sample_rate);
  response->set_channels(result.audio.channels);
  response->set_duration_seconds(result.audio.duration_seconds);
  response->set_byte_size(static_cast<int64_t>(result.audio.byte_size));
  response->set_segment_count(static_cast<int32_t>(result.segment_count));
  response->set_display_speed(result.display_speed);
  response->set_display_speed_speaker_a(result.display_speed_a);
  response->set_display_speed_speaker_b(result.display_speed_b);
  if (result.output_path) response->set_output_path(*result.output_path);
  for (const auto& [id, usage] : result.usage.per_provider) {
    pb::ProviderUsage* entry = response->add_usage();
    entry->set_provider(providers::ProviderName(id));
    entry->set_units_billed(usage.units_billed);
    entry->set_segment_count(usage.segment_count);
    entry->set_estimated_cost(usage.estimated_cost);
  }

  Logger::Info("[RenderDialogue] Rendered " + std::to_string(result.segment_count) +
               " segments, " + std::to_string(result.audio.byte_size) + " bytes");
  return grpc::Status::OK;
}

grpc::Status DialogueSynthesisImpl::GetVersion(grpc::ServerContext* context,
                                               const pb::ApiVersionRequest* request,
                                               pb::ApiVersion* response) {
  (void)context;
  (void)request;
  Logger::Debug("[GetVersion] Request received");
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

bool RunSynthesisServer(const ServerOptions& options,
                        std::shared_ptr<pipeline::DialoguePipeline> pipeline) {
  DialogueSynthesisImpl service(pipeline, options.output_root);

  grpc::ServerBuilder builder;
  int selected_port = 0;
  builder.AddListeningPort(options.address, grpc::InsecureServerCredentials(),
                           &selected_port);
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || selected_port == 0) {
    Logger::Error("[DialogueSynthesisImpl] Failed to listen on " + options.address);
    return false;
  }
  Logger::Info("[DialogueSynthesisImpl] Listening on " + options.address +
               " (output root " + options.output_root + ")");

  std::atomic<bool> serving{true};
  std::thread watcher;
  if (options.stop_requested) {
    watcher = std::thread([&] {
      while (serving.load()) {
        if (options.stop_requested()) {
          Logger::Info("[DialogueSynthesisImpl] Stop requested, shutting down");
          pipeline->Cancel();
          server->Shutdown();
          return;
        }
        std::this_thread::sleep_for(kStopPollInterval);
      }
    });
  }

  server->Wait();
  serving.store(false);
  if (watcher.joinable()) watcher.join();
  return true;
}

}  // namespace dialogcast::service
