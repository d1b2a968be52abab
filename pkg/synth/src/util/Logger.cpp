// Repository: DialogCast
// Component: Logger Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace dialogcast::util {

std::mutex Logger::mutex_;
std::array<Logger::Listener, 4> Logger::listeners_;

void Logger::SetListener(LogLevel level, Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_[static_cast<size_t>(level)] = std::move(listener);
}

void Logger::Write(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && std::getenv("DIALOGCAST_DEBUG") == nullptr) {
    return;
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;

  // One lock per line keeps concurrent workers from interleaving.
  std::lock_guard<std::mutex> lock(mutex_);
  const Listener& listener = listeners_[static_cast<size_t>(level)];
  if (listener) listener(line);
  out << line << '\n';
  out.flush();
}

}  // namespace dialogcast::util
