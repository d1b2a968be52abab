// Repository: DialogCast
// Component: DebugChunkSpool Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/pipeline/DebugChunkSpool.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

#include "dialogcast/util/Logger.hpp"

namespace dialogcast::pipeline {

using dialogcast::util::Logger;
using nlohmann::json;

DebugChunkSpool::DebugChunkSpool(std::string directory,
                                 providers::ProviderId provider)
    : directory_(std::move(directory)), provider_(provider) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    Logger::Warn("[DebugChunkSpool] Cannot create " + directory_ + ": " +
                 ec.message());
  }
}

std::string DebugChunkSpool::PathFor(int32_t segment_index) const {
  return (std::filesystem::path(directory_) /
          ("chunk_" + std::to_string(segment_index + 1) + "_" +
           providers::ProviderTag(provider_) + "_content.json"))
      .string();
}

bool DebugChunkSpool::Write(int32_t segment_index,
                            const std::string& request_json,
                            int64_t character_count) {
  json doc;
  doc["segment_number"] = segment_index + 1;
  doc["provider"] = providers::ProviderName(provider_);
  doc["character_count"] = character_count;
  doc["request"] = json::parse(request_json, nullptr, /*allow_exceptions=*/false);
  if (doc["request"].is_discarded()) doc["request"] = request_json;

  const std::string path = PathFor(segment_index);
  std::ofstream of(path, std::ios::out | std::ios::trunc);
  if (!of) {
    Logger::Warn("[DebugChunkSpool] Cannot write " + path);
    return false;
  }
  of << doc.dump(2) << '\n';
  of.close();
  if (!of) {
    Logger::Warn("[DebugChunkSpool] Short write " + path);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  written_.push_back(path);
  return true;
}

void DebugChunkSpool::RemoveAll() {
  std::vector<std::string> paths;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    paths.swap(written_);
  }
  for (const auto& path : paths) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) Logger::Warn("[DebugChunkSpool] Cannot remove " + path + ": " + ec.message());
  }
  if (!paths.empty()) {
    Logger::Debug("[DebugChunkSpool] Removed " + std::to_string(paths.size()) +
                  " debug chunks");
  }
}

std::vector<std::string> DebugChunkSpool::WrittenPaths() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return written_;
}

}  // namespace dialogcast::pipeline
