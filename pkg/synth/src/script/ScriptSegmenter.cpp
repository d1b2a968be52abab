// Repository: DialogCast
// Component: ScriptSegmenter Implementation
// Purpose: Line-oriented speaker-label parsing with leading tag lifting.
// Copyright (c) 2026 DialogCast

#include "dialogcast/script/ScriptSegmenter.hpp"

#include <sstream>

#include "dialogcast/util/Errors.hpp"
#include "dialogcast/util/Logger.hpp"

namespace dialogcast::script {

using dialogcast::util::Logger;

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool IsEmphasis(char c) { return c == '*' || c == '_'; }

std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && IsSpace(s[start])) ++start;
  size_t end = s.size();
  while (end > start && IsSpace(s[end - 1])) --end;
  return s.substr(start, end - start);
}

size_t SkipEmphasis(const std::string& s, size_t pos) {
  while (pos < s.size() && IsEmphasis(s[pos])) ++pos;
  return pos;
}

// Matches "Speaker A:" with optional emphasis around the label or the colon.
// On match, *speaker and *utterance are set; utterance excludes the label.
bool ParseSpeakerLabel(const std::string& line, Speaker* speaker,
                       std::string* utterance) {
  static const std::string kPrefix = "Speaker ";
  size_t pos = SkipEmphasis(line, 0);
  if (line.compare(pos, kPrefix.size(), kPrefix) != 0) return false;
  pos += kPrefix.size();
  if (pos >= line.size()) return false;

  Speaker parsed;
  if (line[pos] == 'A') {
    parsed = Speaker::kA;
  } else if (line[pos] == 'B') {
    parsed = Speaker::kB;
  } else {
    return false;
  }
  ++pos;

  pos = SkipEmphasis(line, pos);
  if (pos >= line.size() || line[pos] != ':') return false;
  ++pos;
  pos = SkipEmphasis(line, pos);

  *speaker = parsed;
  *utterance = Trim(line.substr(pos));
  return true;
}

// Lifts "[tag]" tokens from the start of text into tags. Returns the rest.
std::string LiftLeadingTags(const std::string& text,
                            std::vector<std::string>* tags) {
  size_t pos = 0;
  while (true) {
    while (pos < text.size() && IsSpace(text[pos])) ++pos;
    if (pos >= text.size() || text[pos] != '[') break;
    const size_t close = text.find(']', pos);
    if (close == std::string::npos) break;
    std::string token = Trim(text.substr(pos + 1, close - pos - 1));
    if (!token.empty()) {
      tags->push_back(std::move(token));
    }
    pos = close + 1;
  }
  return Trim(text.substr(pos));
}

bool IsMarkupOnlyLine(const std::string& line) {
  return line.rfind("#", 0) == 0 || line.rfind("---", 0) == 0;
}

struct PendingSegment {
  Speaker speaker = Speaker::kA;
  std::string text;
  std::vector<std::string> tags;
  int line_number = 0;
};

}  // namespace

std::string CutAtBoundary(const std::string& script, const std::string& marker) {
  if (marker.empty()) return script;
  const size_t pos = script.find(marker);
  if (pos == std::string::npos) return script;

  // Pull the cut back to the line start when only markup precedes the marker
  // on its line ("**SOURCES FOUND:**", "## SOURCES FOUND:").
  size_t cut = pos;
  size_t line_start = 0;
  if (pos > 0) {
    const size_t newline = script.rfind('\n', pos - 1);
    if (newline != std::string::npos) line_start = newline + 1;
  }
  bool markup_only = true;
  for (size_t i = line_start; i < pos; ++i) {
    const char c = script[i];
    if (!IsSpace(c) && !IsEmphasis(c) && c != '#') {
      markup_only = false;
      break;
    }
  }
  if (markup_only) cut = line_start;
  return script.substr(0, cut);
}

ScriptSegmenter::ScriptSegmenter(SegmenterOptions options)
    : options_(std::move(options)) {}

std::vector<Segment> ScriptSegmenter::Split(const std::string& script) const {
  const std::string body = CutAtBoundary(script, options_.boundary_marker);

  std::vector<PendingSegment> pending;
  bool have_current = false;

  std::istringstream stream(body);
  std::string raw_line;
  int line_number = 0;
  while (std::getline(stream, raw_line)) {
    ++line_number;
    const std::string line = Trim(raw_line);
    if (line.empty()) continue;

    Speaker speaker;
    std::string utterance;
    if (ParseSpeakerLabel(line, &speaker, &utterance)) {
      PendingSegment next;
      next.speaker = speaker;
      next.line_number = line_number;
      next.text = LiftLeadingTags(utterance, &next.tags);
      pending.push_back(std::move(next));
      have_current = true;
      continue;
    }

    if (!have_current || IsMarkupOnlyLine(line)) continue;

    PendingSegment& current = pending.back();
    if (current.text.empty()) {
      // Utterance has not started yet: leading tags still belong to it.
      current.text = LiftLeadingTags(line, &current.tags);
    } else {
      current.text += ' ';
      current.text += line;
    }
  }

  if (pending.empty()) {
    throw MalformedScriptError(
        "no 'Speaker A:' / 'Speaker B:' labeled line found in script");
  }

  std::vector<Segment> segments;
  segments.reserve(pending.size());
  for (auto& p : pending) {
    if (p.text.empty()) {
      std::ostringstream oss;
      oss << "[ScriptSegmenter] Dropping empty segment: speaker="
          << SpeakerName(p.speaker) << " line=" << p.line_number
          << " tags=" << p.tags.size();
      Logger::Warn(oss.str());
      continue;
    }
    Segment segment;
    segment.index = static_cast<int32_t>(segments.size());
    segment.speaker = p.speaker;
    segment.text = std::move(p.text);
    segment.emotion_tags = std::move(p.tags);
    if (p.speaker == Speaker::kA && options_.speaker_a_speed) {
      segment.speed_override = options_.speaker_a_speed;
    } else if (p.speaker == Speaker::kB && options_.speaker_b_speed) {
      segment.speed_override = options_.speaker_b_speed;
    }
    segments.push_back(std::move(segment));
  }

  if (segments.empty()) {
    throw MalformedScriptError("no spoken text in any of the " +
                               std::to_string(pending.size()) +
                               " speaker-labeled lines");
  }

  Logger::Debug("[ScriptSegmenter] Parsed " + std::to_string(segments.size()) +
                " segments (" + std::to_string(pending.size() - segments.size()) +
                " dropped)");
  return segments;
}

}  // namespace dialogcast::script
