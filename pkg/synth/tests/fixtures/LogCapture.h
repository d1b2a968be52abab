// Collects every logged line of one level while in scope. The listener is
// removed on destruction, so a failed assertion cannot leak it into later
// tests.

#ifndef DIALOGCAST_TESTS_FIXTURES_LOG_CAPTURE_H_
#define DIALOGCAST_TESTS_FIXTURES_LOG_CAPTURE_H_

#include <mutex>
#include <string>
#include <vector>

#include "dialogcast/util/Logger.hpp"

namespace dialogcast::tests::fixtures {

class LogCapture {
 public:
  explicit LogCapture(util::LogLevel level) : level_(level) {
    util::Logger::SetListener(level_, [this](const std::string& line) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.push_back(line);
    });
  }

  ~LogCapture() { util::Logger::SetListener(level_, nullptr); }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::vector<std::string> lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool Contains(const std::string& fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& line : lines_) {
      if (line.find(fragment) != std::string::npos) return true;
    }
    return false;
  }

 private:
  const util::LogLevel level_;
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
};

}  // namespace dialogcast::tests::fixtures

#endif  // DIALOGCAST_TESTS_FIXTURES_LOG_CAPTURE_H_
