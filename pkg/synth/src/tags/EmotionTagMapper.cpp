// Repository: DialogCast
// Component: EmotionTagMapper Implementation
// Purpose: Static canonical-token tables for ElevenLabs and Cartesia.
// Copyright (c) 2026 DialogCast

#include "dialogcast/tags/EmotionTagMapper.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_map>

namespace dialogcast::tags {

using providers::ProviderId;

namespace {

struct TagRow {
  const char* canonical;
  std::vector<std::string> elevenlabs;  // Empty: no ElevenLabs mapping
  const char* cartesia;                 // nullptr: no Cartesia mapping
};

// Families: excitement, curiosity, surprise, amusement, reflection,
// laughter, delivery/pacing, interruption.
const std::vector<TagRow>& Rows() {
  static const std::vector<TagRow> kRows = {
      // Excitement
      {"excited", {"excited"}, "positivity:high"},
      {"super-excited", {"excited", "fast-paced"}, "positivity:highest"},
      {"enthusiastic", {"enthusiastic"}, "positivity:high"},
      {"thrilled", {"thrilled"}, "positivity:highest"},
      {"energetic", {"energetic"}, "positivity:high"},
      {"eager", {"eager"}, "positivity:high"},
      {"happy", {"happy"}, "positivity:high"},
      {"joyful", {"joyful"}, "positivity:highest"},
      {"delighted", {"delighted"}, "positivity:high"},
      {"cheerful", {"cheerful"}, "positivity:high"},
      {"proud", {"proud"}, "positivity:low"},
      {"triumphant", {"triumphant"}, "positivity:highest"},
      // Curiosity
      {"curious", {"curious"}, "curiosity:high"},
      {"questioning", {"questioning"}, "curiosity:high"},
      {"intrigued", {"intrigued"}, "curiosity:high"},
      {"inquisitive", {"curious"}, "curiosity:high"},
      {"fascinated", {"fascinated"}, "curiosity:highest"},
      {"wondering", {"wondering"}, "curiosity:low"},
      {"interested", {"interested"}, "curiosity:low"},
      {"puzzled", {"confused"}, "curiosity:low"},
      {"confused", {"confused"}, "curiosity:low"},
      {"skeptical", {"skeptical"}, "curiosity:low"},
      {"doubtful", {"skeptical"}, "curiosity:lowest"},
      // Surprise
      {"surprised", {"surprised"}, "surprise:high"},
      {"amazed", {"amazed"}, "surprise:high"},
      {"astonished", {"astonished"}, "surprise:highest"},
      {"shocked", {"shocked"}, "surprise:highest"},
      {"stunned", {"shocked"}, "surprise:high"},
      {"gasps", {"gasps"}, "surprise:high"},
      {"impressed", {"impressed"}, "surprise:low"},
      {"disbelief", {"in disbelief"}, "surprise:low"},
      {"wow", {"impressed", "excited"}, "surprise:high"},
      // Amusement
      {"amused", {"amused"}, "positivity:low"},
      {"playful", {"playful"}, "positivity:low"},
      {"teasing", {"teasing"}, "positivity:low"},
      {"sarcastic", {"sarcastic"}, "positivity:lowest"},
      {"mischievous", {"mischievously"}, "positivity:low"},
      {"wry", {"dryly"}, "positivity:lowest"},
      {"grinning", {"smiling"}, "positivity:low"},
      {"smiling", {"smiling"}, "positivity:low"},
      // Reflection
      {"thoughtful", {"thoughtful"}, "curiosity:low"},
      {"reflective", {"reflective"}, "curiosity:low"},
      {"analytical", {"analytical"}, "curiosity:low"},
      {"contemplative", {"thoughtful", "slowly"}, "curiosity:lowest"},
      {"pensive", {"thoughtful"}, "sadness:lowest"},
      {"serious", {"serious"}, nullptr},
      {"calm", {"calm"}, "positivity:lowest"},
      {"hmm", {"hmm"}, "curiosity:low"},
      {"sighs", {"sighs"}, "sadness:low"},
      {"hesitant", {"hesitant"}, "sadness:lowest"},
      {"nervous", {"nervous"}, "sadness:low"},
      {"worried", {"worried"}, "anger:low"},
      {"concerned", {"concerned"}, "curiosity:low"},
      {"sad", {"sad"}, "sadness:high"},
      {"frustrated", {"frustrated"}, "anger:high"},
      {"annoyed", {"annoyed"}, "anger:low"},
      // Laughter
      {"laughs", {"laughs"}, "positivity:high"},
      {"laughing", {"laughing"}, "positivity:high"},
      {"laughs-hard", {"laughs harder"}, "positivity:highest"},
      {"chuckles", {"chuckles"}, "positivity:low"},
      {"giggles", {"giggles"}, "positivity:high"},
      {"snorts", {"snorts"}, "positivity:low"},
      // Delivery and pacing
      {"fast-paced", {"fast-paced"}, nullptr},
      {"slowly", {"slowly"}, nullptr},
      {"pause", {"pause"}, nullptr},
      {"quietly", {"quietly"}, nullptr},
      {"loudly", {"loudly"}, nullptr},
      {"whispers", {"whispers"}, nullptr},
      // Interruption
      {"interrupting", {"interrupting"}, nullptr},
      {"overlapping", {"overlapping"}, nullptr},
      {"interjecting", {"interjecting"}, nullptr},
  };
  return kRows;
}

const std::unordered_map<std::string, std::vector<std::string>>& ElevenLabsTable() {
  static const std::unordered_map<std::string, std::vector<std::string>> kTable = [] {
    std::unordered_map<std::string, std::vector<std::string>> table;
    for (const auto& row : Rows()) {
      if (!row.elevenlabs.empty()) table[row.canonical] = row.elevenlabs;
    }
    return table;
  }();
  return kTable;
}

const std::unordered_map<std::string, std::string>& CartesiaTable() {
  static const std::unordered_map<std::string, std::string> kTable = [] {
    std::unordered_map<std::string, std::string> table;
    for (const auto& row : Rows()) {
      if (row.cartesia != nullptr) table[row.canonical] = row.cartesia;
    }
    return table;
  }();
  return kTable;
}

std::string Normalize(const std::string& token) {
  const char* ws = " \t\r\n";
  const size_t start = token.find_first_not_of(ws);
  if (start == std::string::npos) return "";
  const size_t end = token.find_last_not_of(ws);
  std::string out = token.substr(start, end - start + 1);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

size_t CartesiaRank(const std::string& label) {
  const auto& priority = EmotionTagMapper::CartesiaPriority();
  auto it = std::find(priority.begin(), priority.end(), label);
  if (it == priority.end()) return priority.size();
  return static_cast<size_t>(it - priority.begin());
}

}  // namespace

std::string ProviderTags::ToInlineMarkup() const {
  std::string out;
  for (const auto& label : labels) {
    if (!out.empty()) out += ' ';
    out += '[';
    out += label;
    out += ']';
  }
  return out;
}

EmotionTagMapper::EmotionTagMapper(TagMapperConfig config)
    : config_(std::move(config)) {}

const std::vector<std::string>& EmotionTagMapper::CartesiaPriority() {
  static const std::vector<std::string> kPriority = {
      "surprise:highest", "positivity:highest", "surprise:high",
      "positivity:high",  "curiosity:highest",  "curiosity:high",
      "anger:high",       "sadness:high",       "positivity:low",
      "curiosity:low",    "surprise:low",       "anger:low",
      "sadness:low",      "positivity:lowest",  "curiosity:lowest",
      "surprise:lowest",  "sadness:lowest",     "anger:lowest",
  };
  return kPriority;
}

const std::string& EmotionTagMapper::DefaultNeutral(ProviderId provider) const {
  return provider == ProviderId::kCartesia ? config_.cartesia_default_neutral
                                           : config_.elevenlabs_default_neutral;
}

bool EmotionTagMapper::IsMapped(const std::string& canonical_tag,
                                ProviderId provider) const {
  const std::string key = Normalize(canonical_tag);
  switch (provider) {
    case ProviderId::kElevenLabs:
      return ElevenLabsTable().count(key) > 0;
    case ProviderId::kCartesia:
      return CartesiaTable().count(key) > 0;
  }
  return false;
}

ProviderTags EmotionTagMapper::Resolve(const std::vector<std::string>& canonical_tags,
                                       ProviderId provider) const {
  ProviderTags out;
  if (canonical_tags.empty()) return out;

  if (provider == ProviderId::kElevenLabs) {
    const auto& table = ElevenLabsTable();
    for (const auto& tag : canonical_tags) {
      auto it = table.find(Normalize(tag));
      if (it == table.end()) {
        out.labels.push_back(config_.elevenlabs_default_neutral);
        continue;
      }
      out.labels.insert(out.labels.end(), it->second.begin(), it->second.end());
    }
    return out;
  }

  // Cartesia: one label wins. Earlier tokens win ties.
  const auto& table = CartesiaTable();
  std::string best = config_.cartesia_default_neutral;
  size_t best_rank = std::numeric_limits<size_t>::max();
  for (const auto& tag : canonical_tags) {
    auto it = table.find(Normalize(tag));
    const std::string& label =
        it == table.end() ? config_.cartesia_default_neutral : it->second;
    const size_t rank = CartesiaRank(label);
    if (rank < best_rank) {
      best_rank = rank;
      best = label;
    }
  }
  out.labels.push_back(best);
  return out;
}

std::vector<std::string> EmotionTagMapper::CanonicalTokens(ProviderId provider) {
  std::vector<std::string> tokens;
  for (const auto& row : Rows()) {
    const bool mapped = provider == ProviderId::kElevenLabs
                            ? !row.elevenlabs.empty()
                            : row.cartesia != nullptr;
    if (mapped) tokens.emplace_back(row.canonical);
  }
  std::sort(tokens.begin(), tokens.end());
  return tokens;
}

}  // namespace dialogcast::tags
