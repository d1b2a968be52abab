// Repository: DialogCast
// Component: ArtifactWriter
// Purpose: Atomic artifact writes and the artifact naming scheme.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PIPELINE_ARTIFACT_WRITER_HPP_
#define DIALOGCAST_PIPELINE_ARTIFACT_WRITER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "dialogcast/audio/AudioEncoder.hpp"
#include "dialogcast/providers/ProviderId.hpp"
#include "dialogcast/providers/ProviderTypes.hpp"

namespace dialogcast::pipeline {

// Writes <path>.partial, fsyncs it, then renames over <path>. A crash or
// error never leaves a truncated file at <path>. Creates missing parent
// directories. Throws std::runtime_error on failure (the .partial is
// removed).
void WriteAtomically(const std::string& path, const std::vector<uint8_t>& bytes);

struct ArtifactNameParts {
  std::string project;
  std::string language_code;  // "de"
  std::string date;           // YYYY-MM-DD; empty = today (local time)
  std::string topic;
  providers::ProviderId provider = providers::ProviderId::kElevenLabs;
  double overall_speed = 1.0;  // Display scale
  double male_speed = 1.0;     // Speaker B
  double female_speed = 1.0;   // Speaker A
  providers::QualityTier tier = providers::QualityTier::kPrototype;
  audio::OutputContainer container = audio::OutputContainer::kMp3;
};

// <project>_<lang>_<date>_<topic>_<TAG>_OS1.05_MS1.05_FS1.05_PROTOTYPE.mp3
// Project is lowercased; path separators and spaces in the topic become '-'.
std::string BuildArtifactName(const ArtifactNameParts& parts);

std::string TodayIsoDate();

}  // namespace dialogcast::pipeline

#endif  // DIALOGCAST_PIPELINE_ARTIFACT_WRITER_HPP_
