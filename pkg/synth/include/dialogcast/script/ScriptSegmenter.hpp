// Repository: DialogCast
// Component: ScriptSegmenter
// Purpose: Splits a cleaned dialogue script into ordered, speaker-attributed
//          segments with leading emotion tags lifted out of the spoken text.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_SCRIPT_SCRIPT_SEGMENTER_HPP_
#define DIALOGCAST_SCRIPT_SCRIPT_SEGMENTER_HPP_

#include <optional>
#include <string>
#include <vector>

#include "dialogcast/script/Segment.hpp"

namespace dialogcast::script {

struct SegmenterOptions {
  // Everything at or after the first occurrence is dropped.
  std::string boundary_marker = "SOURCES FOUND:";
  // Stamped into speed_override of every segment of that speaker.
  std::optional<double> speaker_a_speed;
  std::optional<double> speaker_b_speed;
};

// Parsing rules:
// - A line starting with "Speaker A:" / "Speaker B:" (case-sensitive; emphasis
//   markup such as "**Speaker A:**" is stripped) opens a new segment.
// - "[tag]" tokens at the start of the utterance become emotion_tags.
// - Other lines continue the current segment (space-joined).
// - Segments left without text are dropped with a warning and indices are
//   reassigned densely.
//
// Throws MalformedScriptError when no speaker-labeled line exists or when
// every labeled line is dropped for lack of text.
class ScriptSegmenter {
 public:
  explicit ScriptSegmenter(SegmenterOptions options = SegmenterOptions());

  std::vector<Segment> Split(const std::string& script) const;

  const SegmenterOptions& options() const { return options_; }

 private:
  SegmenterOptions options_;
};

// Removes the boundary marker and everything after it. Exposed for tests.
std::string CutAtBoundary(const std::string& script, const std::string& marker);

}  // namespace dialogcast::script

#endif  // DIALOGCAST_SCRIPT_SCRIPT_SEGMENTER_HPP_
