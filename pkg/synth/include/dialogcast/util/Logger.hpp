// Repository: DialogCast
// Component: Logger
// Purpose: Leveled line logging shared by pipeline workers, the CLI and the
//          gRPC handlers.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_UTIL_LOGGER_HPP_
#define DIALOGCAST_UTIL_LOGGER_HPP_

#include <array>
#include <functional>
#include <mutex>
#include <string>

namespace dialogcast::util {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

// Logger writes one complete line per call. Callers put the component in
// brackets at the start of the line ("[DialoguePipeline] ...").
//
// kDebug and kInfo go to stdout, kWarn and kError to stderr. kDebug is
// dropped unless DIALOGCAST_DEBUG is set in the environment.
//
// A listener registered for a level sees every line of that level before it
// is written. Tests use listeners to observe warnings and failures.
class Logger {
 public:
  using Listener = std::function<void(const std::string& line)>;

  static void Debug(const std::string& line) { Write(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Write(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Write(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Write(LogLevel::kError, line); }

  // Replaces the listener for level; nullptr removes it.
  static void SetListener(LogLevel level, Listener listener);

 private:
  static void Write(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static std::array<Listener, 4> listeners_;  // Guarded by mutex_
};

}  // namespace dialogcast::util

#endif  // DIALOGCAST_UTIL_LOGGER_HPP_
