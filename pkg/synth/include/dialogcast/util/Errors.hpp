// Repository: DialogCast
// Component: Error Taxonomy
// Purpose: Exception types that abort a synthesis run.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_UTIL_ERRORS_HPP_
#define DIALOGCAST_UTIL_ERRORS_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace dialogcast {

// No speaker-labeled content found. The caller must re-supply a valid script.
class MalformedScriptError : public std::runtime_error {
 public:
  explicit MalformedScriptError(const std::string& what)
      : std::runtime_error(what) {}
};

// Provider rejected or failed a request. Carries provider + segment context.
// segment_index is -1 when the failure is not tied to one segment.
class SynthesisError : public std::runtime_error {
 public:
  SynthesisError(std::string provider, int32_t segment_index,
                 const std::string& reason)
      : std::runtime_error("[" + provider + "] segment " +
                           std::to_string(segment_index) + ": " + reason),
        provider_(std::move(provider)),
        segment_index_(segment_index),
        reason_(reason) {}

  const std::string& provider() const { return provider_; }
  int32_t segment_index() const { return segment_index_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string provider_;
  int32_t segment_index_;
  std::string reason_;
};

// Network failure or rate limit. Never leaves the adapter's retry loop:
// exhausting the attempts escalates it to SynthesisError.
class TransientProviderError : public std::runtime_error {
 public:
  TransientProviderError(std::string provider, int32_t segment_index,
                         int http_status, const std::string& reason)
      : std::runtime_error("[" + provider + "] segment " +
                           std::to_string(segment_index) + " transient (" +
                           std::to_string(http_status) + "): " + reason),
        provider_(std::move(provider)),
        segment_index_(segment_index),
        http_status_(http_status) {}

  const std::string& provider() const { return provider_; }
  int32_t segment_index() const { return segment_index_; }
  // 0 when no HTTP response was received.
  int http_status() const { return http_status_; }

 private:
  std::string provider_;
  int32_t segment_index_;
  int http_status_;
};

// Sequence gap or irreconcilable audio formats. Always fatal.
class AssemblyError : public std::runtime_error {
 public:
  explicit AssemblyError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or invalid configuration (config file, API key, unknown provider).
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Run was cancelled because another segment failed. Internal to the
// scheduler; the first real failure is what propagates.
class CancelledError : public std::runtime_error {
 public:
  explicit CancelledError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace dialogcast

#endif  // DIALOGCAST_UTIL_ERRORS_HPP_
