// Repository: DialogCast
// Component: Segment
// Purpose: One speaker's contiguous utterance extracted from a dialogue script.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_SCRIPT_SEGMENT_HPP_
#define DIALOGCAST_SCRIPT_SEGMENT_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dialogcast::script {

enum class Speaker { kA, kB };

inline const char* SpeakerName(Speaker speaker) {
  return speaker == Speaker::kA ? "A" : "B";
}

// Immutable once produced by ScriptSegmenter; consumed read-only by synthesis.
struct Segment {
  int32_t index = 0;  // Dense playback order, 0-based
  Speaker speaker = Speaker::kA;
  std::string text;   // Spoken content only
  std::vector<std::string> emotion_tags;  // Canonical tokens, encounter order
  std::optional<double> speed_override;   // User-scale speed
};

}  // namespace dialogcast::script

#endif  // DIALOGCAST_SCRIPT_SEGMENT_HPP_
