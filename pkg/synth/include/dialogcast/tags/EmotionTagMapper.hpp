// Repository: DialogCast
// Component: EmotionTagMapper
// Purpose: Translates canonical emotion tokens into the literal tag(s) or
//          label a specific provider expects.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_TAGS_EMOTION_TAG_MAPPER_HPP_
#define DIALOGCAST_TAGS_EMOTION_TAG_MAPPER_HPP_

#include <string>
#include <vector>

#include "dialogcast/providers/ProviderId.hpp"

namespace dialogcast::tags {

// Provider-native tag representation.
// ElevenLabs: zero or more inline labels, one group per input token.
// Cartesia: at most one "emotion:level" label (best match by priority).
struct ProviderTags {
  std::vector<std::string> labels;

  bool empty() const { return labels.empty(); }

  // "[excited] [fast-paced]": inline markup form.
  std::string ToInlineMarkup() const;

  bool operator==(const ProviderTags& other) const {
    return labels == other.labels;
  }
};

struct TagMapperConfig {
  // Substituted for any token without an explicit mapping.
  std::string elevenlabs_default_neutral = "neutral";
  std::string cartesia_default_neutral = "neutral";
};

// Static per-provider lookup tables, built once on first use. Resolve() is a
// pure function of (tokens, provider, config): no state is mutated.
// Tokens are matched case-insensitively after trimming.
class EmotionTagMapper {
 public:
  explicit EmotionTagMapper(TagMapperConfig config = TagMapperConfig());

  ProviderTags Resolve(const std::vector<std::string>& canonical_tags,
                       providers::ProviderId provider) const;

  // True when the token has an explicit mapping for provider.
  bool IsMapped(const std::string& canonical_tag,
                providers::ProviderId provider) const;

  // Canonical vocabulary with an explicit mapping for provider, sorted.
  static std::vector<std::string> CanonicalTokens(providers::ProviderId provider);

  // Cartesia label priority, highest first (excluding the neutral default).
  static const std::vector<std::string>& CartesiaPriority();

  const std::string& DefaultNeutral(providers::ProviderId provider) const;

 private:
  TagMapperConfig config_;
};

}  // namespace dialogcast::tags

#endif  // DIALOGCAST_TAGS_EMOTION_TAG_MAPPER_HPP_
