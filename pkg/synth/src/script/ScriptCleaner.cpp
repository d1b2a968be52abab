// Repository: DialogCast
// Component: ScriptCleaner Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/script/ScriptCleaner.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

#include "dialogcast/util/Logger.hpp"

namespace dialogcast::script {

using dialogcast::util::Logger;

namespace {

std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

std::string TrimCopy(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos) return "";
  const size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

// "**SOURCES FOUND:**", "## SOURCES FOUND:", "SOURCES FOUND:" all match.
bool IsBoundaryLine(const std::string& line, const std::string& upper_marker) {
  size_t pos = 0;
  while (pos < line.size() &&
         (line[pos] == '*' || line[pos] == '#' || line[pos] == ' ' ||
          line[pos] == '\t')) {
    ++pos;
  }
  return ToUpper(line.substr(pos)).rfind(upper_marker, 0) == 0;
}

bool IsDroppedLine(const std::string& trimmed) {
  static const std::regex kSeparator("^-{3,}$");
  static const std::regex kHeader("^#+\\s+.*$");
  static const std::regex kStageDirection("^\\*[^\\[]*\\*$");
  static const std::regex kWordCount(
      "^\\*{0,2}word count:?\\s*\\d+\\s*words?\\*{0,2}$", std::regex::icase);
  static const std::regex kApproxCount(
      "^\\*{0,2}(total|approximate)?\\s*(script\\s+)?(length|count)?:?\\s*~?\\d+"
      "\\s*words?\\*{0,2}$",
      std::regex::icase);
  static const std::regex kTotalLength("^total script length:.*$",
                                       std::regex::icase);

  // "**Speaker A:** ..." must survive the stage-direction rule.
  if (trimmed.find("Speaker ") != std::string::npos) return false;

  return std::regex_match(trimmed, kSeparator) ||
         std::regex_match(trimmed, kHeader) ||
         std::regex_match(trimmed, kStageDirection) ||
         std::regex_match(trimmed, kWordCount) ||
         std::regex_match(trimmed, kApproxCount) ||
         std::regex_match(trimmed, kTotalLength);
}

}  // namespace

std::string CleanScriptForAudio(const std::string& script,
                                const std::string& boundary_marker,
                                CleanReport* report) {
  CleanReport local;
  const size_t original_length = script.size();
  std::string text = script;

  static const std::regex kFirstSpeaker("\\*{0,2}Speaker [AB]\\*{0,2}:");
  std::smatch match;
  if (std::regex_search(text, match, kFirstSpeaker)) {
    local.preamble_chars_removed = static_cast<size_t>(match.position(0));
    text = text.substr(local.preamble_chars_removed);
  }

  static const std::regex kSearchQualityCheck(
      "<search_quality_check>[\\s\\S]*?</search_quality_check>");
  static const std::regex kSearchQualityScore(
      "<search_quality_score>[\\s\\S]*?</search_quality_score>");
  static const std::regex kSearchBlock("<search>[\\s\\S]*?</search>");
  text = std::regex_replace(text, kSearchQualityCheck, "");
  text = std::regex_replace(text, kSearchQualityScore, "");
  text = std::regex_replace(text, kSearchBlock, "");

  const std::string upper_marker = ToUpper(boundary_marker);
  std::vector<std::string> kept;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!upper_marker.empty() && IsBoundaryLine(line, upper_marker)) {
      local.boundary_found = true;
      break;
    }
    const std::string trimmed = TrimCopy(line);
    if (!trimmed.empty() && IsDroppedLine(trimmed)) continue;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    kept.push_back(line);
  }

  std::string out;
  bool previous_blank = false;
  for (const auto& l : kept) {
    const bool blank = TrimCopy(l).empty();
    if (blank && previous_blank) continue;
    previous_blank = blank;
    out += l;
    out += '\n';
  }
  out = TrimCopy(out);

  local.total_chars_removed =
      original_length > out.size() ? original_length - out.size() : 0;

  if (local.preamble_chars_removed > 0) {
    Logger::Info("[ScriptCleaner] Removed preamble (" +
                 std::to_string(local.preamble_chars_removed) + " chars)");
  }
  if (!local.boundary_found) {
    Logger::Warn("[ScriptCleaner] No '" + boundary_marker +
                 "' marker detected - check if script has a sources section");
  }
  if (local.total_chars_removed > 0) {
    Logger::Info("[ScriptCleaner] Removed " +
                 std::to_string(local.total_chars_removed) +
                 " characters of non-dialogue content");
  }

  if (report) *report = local;
  return out;
}

}  // namespace dialogcast::script
