// Repository: DialogCast
// Component: SynthesisScheduler
// Purpose: Bounded fan-out of per-segment synthesis jobs with an ordered
//          fan-in and fail-fast cancellation.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PIPELINE_SYNTHESIS_SCHEDULER_HPP_
#define DIALOGCAST_PIPELINE_SYNTHESIS_SCHEDULER_HPP_

#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "dialogcast/providers/CancellationToken.hpp"
#include "dialogcast/providers/ProviderTypes.hpp"

namespace dialogcast::pipeline {

// SynthesisScheduler runs one job per segment on up to max_concurrency
// worker threads and collects results into slots indexed by job position.
//
// Run() is the fan-in barrier: it returns only after every job finished, or
// after the run aborted and all workers exited.
//
// Failure: the first job that throws anything other than CancelledError
// raises the run's cancellation token, drops every queued job, releases the
// chunks collected so far, and is rethrown from Run() once workers exit.
//
// max_concurrency == 1 runs the jobs sequentially on the calling thread.
class SynthesisScheduler {
 public:
  using Job = std::function<providers::AudioChunk(
      const providers::CancellationToken& cancel)>;

  explicit SynthesisScheduler(int max_concurrency);

  SynthesisScheduler(const SynthesisScheduler&) = delete;
  SynthesisScheduler& operator=(const SynthesisScheduler&) = delete;

  std::vector<providers::AudioChunk> Run(std::vector<Job> jobs);

  // Cancels the run in progress from another thread. Run() then throws
  // CancelledError unless a job already failed. With no run in progress the
  // request is held and the next Run() throws CancelledError without
  // starting any job.
  void Cancel();

  int max_concurrency() const { return max_concurrency_; }

 private:
  void WorkerLoop();
  void ExecuteJob(size_t index);
  void RecordFailure(std::exception_ptr error);
  void ResetLocked();
  void Finish();

  const int max_concurrency_;

  std::mutex mutex_;
  std::deque<size_t> queue_;                                  // Guarded by mutex_
  std::vector<Job> jobs_;
  std::vector<std::optional<providers::AudioChunk>> slots_;  // Guarded by mutex_
  std::exception_ptr first_error_;                            // Guarded by mutex_
  std::shared_ptr<providers::CancellationToken> cancel_;      // Guarded by mutex_
  bool cancel_requested_ = false;                             // Guarded by mutex_
};

}  // namespace dialogcast::pipeline

#endif  // DIALOGCAST_PIPELINE_SYNTHESIS_SCHEDULER_HPP_
