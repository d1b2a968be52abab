// Repository: DialogCast
// Component: DialogueSynthesis gRPC Service Implementation
// Purpose: Exposes DialoguePipeline::Run over gRPC.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_SYNTHESIS_SERVICE_H_
#define DIALOGCAST_SYNTHESIS_SERVICE_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "dialogcast_synthesis_v1.grpc.pb.h"
#include "dialogcast_synthesis_v1.pb.h"
#include "dialogcast/pipeline/DialoguePipeline.hpp"

namespace dialogcast::service {

namespace pb = ::dialogcast::synthesis::v1;

constexpr char kApiVersion[] = "1.0.0";

// Resolves a client-supplied relative path under output_root. Returns nullopt
// for absolute paths and for paths that climb out of the root with "..".
// The check is lexical; symlinks inside the root are not followed.
std::optional<std::string> ResolveUnderRoot(const std::string& output_root,
                                            const std::string& requested);

// DialogueSynthesisImpl is a thin adapter over DialoguePipeline. Runs are
// serialized by the pipeline; concurrent RPCs queue behind each other.
//
// output_path and debug_dir in requests are confined to output_root.
class DialogueSynthesisImpl final : public pb::DialogueSynthesis::Service {
 public:
  DialogueSynthesisImpl(std::shared_ptr<pipeline::DialoguePipeline> pipeline,
                        std::string output_root = ".");
  ~DialogueSynthesisImpl() override;

  DialogueSynthesisImpl(const DialogueSynthesisImpl&) = delete;
  DialogueSynthesisImpl& operator=(const DialogueSynthesisImpl&) = delete;

  grpc::Status RenderDialogue(grpc::ServerContext* context,
                              const pb::RenderDialogueRequest* request,
                              pb::RenderDialogueResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const pb::ApiVersionRequest* request,
                          pb::ApiVersion* response) override;

 private:
  std::shared_ptr<pipeline::DialoguePipeline> pipeline_;
  const std::string output_root_;
};

struct ServerOptions {
  std::string address = "0.0.0.0:50061";
  std::string output_root = ".";
  // Polled while serving; returning true cancels the active run and shuts
  // the server down. Unset means serve until the process is killed.
  std::function<bool()> stop_requested;
};

// Blocks until the server shuts down. Returns false when the listen address
// cannot be bound.
bool RunSynthesisServer(const ServerOptions& options,
                        std::shared_ptr<pipeline::DialoguePipeline> pipeline);

}  // namespace dialogcast::service

#endif  // DIALOGCAST_SYNTHESIS_SERVICE_H_
