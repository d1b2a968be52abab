// Repository: DialogCast
// Component: DebugChunkSpool
// Purpose: Per-segment provider request dumps kept for post-mortem of
//          failed runs.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PIPELINE_DEBUG_CHUNK_SPOOL_HPP_
#define DIALOGCAST_PIPELINE_DEBUG_CHUNK_SPOOL_HPP_

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "dialogcast/providers/ProviderId.hpp"

namespace dialogcast::pipeline {

// Files: <directory>/chunk_<n>_<TAG>_content.json, n = segment index + 1.
// Write() is called from synthesis workers. The pipeline calls RemoveAll()
// after a successful run; after a failure the files stay behind.
// Write failures are logged, never thrown: the spool must not fail a run.
class DebugChunkSpool {
 public:
  DebugChunkSpool(std::string directory, providers::ProviderId provider);

  DebugChunkSpool(const DebugChunkSpool&) = delete;
  DebugChunkSpool& operator=(const DebugChunkSpool&) = delete;

  // request_json: the body the adapter sends. Returns false on I/O failure.
  bool Write(int32_t segment_index, const std::string& request_json,
             int64_t character_count);

  // Deletes every file written by this spool.
  void RemoveAll();

  std::string PathFor(int32_t segment_index) const;
  std::vector<std::string> WrittenPaths() const;
  const std::string& directory() const { return directory_; }

 private:
  std::string directory_;
  providers::ProviderId provider_;

  mutable std::mutex mutex_;
  std::vector<std::string> written_;  // Guarded by mutex_
};

}  // namespace dialogcast::pipeline

#endif  // DIALOGCAST_PIPELINE_DEBUG_CHUNK_SPOOL_HPP_
