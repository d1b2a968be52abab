// Repository: DialogCast
// Component: ArtifactWriter Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/pipeline/ArtifactWriter.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <stdexcept>

#include "dialogcast/util/Logger.hpp"

namespace dialogcast::pipeline {

using dialogcast::util::Logger;

namespace {

std::string ErrnoMessage(const std::string& what, const std::string& path) {
  return what + " " + path + ": " + std::strerror(errno);
}

std::string FormatSpeed(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  return buf;
}

}  // namespace

void WriteAtomically(const std::string& path, const std::vector<uint8_t>& bytes) {
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create " +
                               target.parent_path().string() + ": " +
                               ec.message());
    }
  }

  const std::string partial = path + ".partial";
  const int fd = ::open(partial.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) throw std::runtime_error(ErrnoMessage("cannot open", partial));

  size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      const std::string msg = ErrnoMessage("write failed", partial);
      ::close(fd);
      ::unlink(partial.c_str());
      throw std::runtime_error(msg);
    }
    written += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    const std::string msg = ErrnoMessage("fsync failed", partial);
    ::close(fd);
    ::unlink(partial.c_str());
    throw std::runtime_error(msg);
  }
  if (::close(fd) != 0) {
    const std::string msg = ErrnoMessage("close failed", partial);
    ::unlink(partial.c_str());
    throw std::runtime_error(msg);
  }
  if (std::rename(partial.c_str(), path.c_str()) != 0) {
    const std::string msg = ErrnoMessage("rename failed", partial);
    ::unlink(partial.c_str());
    throw std::runtime_error(msg);
  }

  Logger::Info("[ArtifactWriter] Wrote " + path + " (" +
               std::to_string(bytes.size()) + " bytes)");
}

std::string TodayIsoDate() {
  const time_t now = std::time(nullptr);
  struct tm tm;
  if (localtime_r(&now, &tm) == nullptr) return "0000-00-00";
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
  return buf;
}

std::string BuildArtifactName(const ArtifactNameParts& parts) {
  std::string project = parts.project;
  std::transform(project.begin(), project.end(), project.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  std::string topic = parts.topic;
  std::replace_if(
      topic.begin(), topic.end(),
      [](char c) { return c == '/' || c == '\\' || c == ' '; }, '-');

  std::string name;
  name += project;
  name += "_" + parts.language_code;
  name += "_" + (parts.date.empty() ? TodayIsoDate() : parts.date);
  name += "_" + topic;
  name += "_" + providers::ProviderTag(parts.provider);
  name += "_OS" + FormatSpeed(parts.overall_speed);
  name += "_MS" + FormatSpeed(parts.male_speed);
  name += "_FS" + FormatSpeed(parts.female_speed);
  name += "_";
  name += providers::QualityTierTag(parts.tier);
  name += ".";
  name += audio::ContainerExtension(parts.container);
  return name;
}

}  // namespace dialogcast::pipeline
