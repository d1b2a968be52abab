// Repository: DialogCast
// Component: SynthesisScheduler Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/pipeline/SynthesisScheduler.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <thread>

#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::pipeline {

using dialogcast::util::Logger;
using providers::AudioChunk;
using providers::CancellationToken;

SynthesisScheduler::SynthesisScheduler(int max_concurrency)
    : max_concurrency_(std::max(1, max_concurrency)) {}

void SynthesisScheduler::Cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
  if (cancel_) {
    cancel_->Cancel();
  } else {
    // No run in progress: the next Run() starts already cancelled.
    cancel_requested_ = true;
  }
}

void SynthesisScheduler::RecordFailure(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!first_error_) {
    first_error_ = error;
    queue_.clear();
    if (cancel_) cancel_->Cancel();
  }
}

void SynthesisScheduler::ExecuteJob(size_t index) {
  std::shared_ptr<CancellationToken> cancel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel = cancel_;
  }
  try {
    AudioChunk chunk = jobs_[index](*cancel);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!first_error_) slots_[index] = std::move(chunk);
  } catch (const CancelledError&) {
    // Secondary effect of an earlier failure or an external Cancel().
  } catch (...) {
    RecordFailure(std::current_exception());
  }
}

void SynthesisScheduler::WorkerLoop() {
  while (true) {
    size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty()) return;
      index = queue_.front();
      queue_.pop_front();
    }
    ExecuteJob(index);
  }
}

void SynthesisScheduler::ResetLocked() {
  slots_.clear();
  jobs_.clear();
  first_error_ = nullptr;
  cancel_.reset();
}

void SynthesisScheduler::Finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  ResetLocked();
}

std::vector<AudioChunk> SynthesisScheduler::Run(std::vector<Job> jobs) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_ = std::move(jobs);
    slots_.assign(jobs_.size(), std::nullopt);
    queue_.clear();
    first_error_ = nullptr;
    cancel_ = std::make_shared<CancellationToken>();
    if (cancel_requested_) {
      cancel_requested_ = false;
      cancel_->Cancel();
    } else {
      for (size_t i = 0; i < jobs_.size(); ++i) queue_.push_back(i);
    }
  }

  const size_t worker_count =
      std::min(static_cast<size_t>(max_concurrency_), jobs_.size());
  {
    std::ostringstream oss;
    oss << "[SynthesisScheduler] " << jobs_.size() << " jobs, "
        << (worker_count <= 1 ? std::string("sequential")
                              : std::to_string(worker_count) + " workers");
    Logger::Info(oss.str());
  }

  if (worker_count <= 1) {
    WorkerLoop();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
      for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(&SynthesisScheduler::WorkerLoop, this);
      }
    } catch (const std::system_error& e) {
      Logger::Error("[SynthesisScheduler] Worker spawn failed: " +
                    std::string(e.what()));
      {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        cancel_->Cancel();
      }
      for (auto& worker : workers) worker.join();
      Finish();
      throw;
    }
    for (auto& worker : workers) worker.join();
  }

  std::vector<AudioChunk> out;
  std::exception_ptr error;
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    error = first_error_;
    cancelled = cancel_->IsCancelled();
    if (!error && !cancelled) {
      out.reserve(slots_.size());
      for (auto& slot : slots_) {
        // A job may abandon its slot by throwing CancelledError on its own.
        if (!slot) {
          cancelled = true;
          out.clear();
          break;
        }
        out.push_back(std::move(*slot));
      }
    }
    ResetLocked();
  }

  if (error) std::rethrow_exception(error);
  if (cancelled) throw CancelledError("[SynthesisScheduler] Run cancelled");
  return out;
}

}  // namespace dialogcast::pipeline
