// Repository: DialogCast
// Component: ScriptCleaner
// Purpose: Strips non-dialogue content (LLM preamble, search blocks, source
//          listings, markdown furniture) before segmentation.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_SCRIPT_SCRIPT_CLEANER_HPP_
#define DIALOGCAST_SCRIPT_SCRIPT_CLEANER_HPP_

#include <string>

namespace dialogcast::script {

struct CleanReport {
  size_t preamble_chars_removed = 0;
  size_t total_chars_removed = 0;
  bool boundary_found = false;
};

// Cleaning order matters: the source listing is cut before separator lines
// are removed, since a "---" usually precedes it.
//
// 1. Drop everything before the first "Speaker A:" / "Speaker B:" label.
// 2. Remove <search_quality_check>, <search_quality_score>, <search> blocks.
// 3. Cut at the first line starting with the boundary marker
//    (case-insensitive, optional "**" / "##" decoration).
// 4. Drop separator lines, markdown headers, stand-alone "*stage direction*"
//    lines without audio tags, and word-count lines.
// 5. Collapse runs of blank lines to one and trim.
std::string CleanScriptForAudio(const std::string& script,
                                const std::string& boundary_marker = "SOURCES FOUND:",
                                CleanReport* report = nullptr);

}  // namespace dialogcast::script

#endif  // DIALOGCAST_SCRIPT_SCRIPT_CLEANER_HPP_
