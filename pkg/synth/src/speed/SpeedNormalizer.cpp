// Repository: DialogCast
// Component: SpeedNormalizer Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/speed/SpeedNormalizer.hpp"

#include <algorithm>
#include <sstream>

#include "dialogcast/util/Logger.hpp"

namespace dialogcast::speed {

using dialogcast::util::Logger;
using providers::ProviderId;

NativeSpeedRange NativeRangeFor(ProviderId provider) {
  switch (provider) {
    case ProviderId::kElevenLabs:
      return NativeSpeedRange{kMinUserSpeed, kMaxUserSpeed, 0.0, 1.0};
    case ProviderId::kCartesia:
      return NativeSpeedRange{-1.0, 1.0, 1.0, 2.0};
  }
  return NativeSpeedRange{kMinUserSpeed, kMaxUserSpeed, 0.0, 1.0};
}

double ToProviderSpeed(double user_speed, ProviderId provider, bool* clamped) {
  const NativeSpeedRange range = NativeRangeFor(provider);
  const double native = (user_speed - range.center) * range.scale;
  const double bounded = std::clamp(native, range.min_native, range.max_native);
  const bool was_clamped = bounded != native;
  if (was_clamped) {
    std::ostringstream oss;
    oss << "[SpeedNormalizer] Speed " << user_speed << " maps to " << native
        << " outside " << providers::ProviderName(provider) << " range ["
        << range.min_native << ", " << range.max_native << "]; clamped to "
        << bounded;
    Logger::Warn(oss.str());
  }
  if (clamped) *clamped = was_clamped;
  return bounded;
}

double ToDisplaySpeed(double native_speed, ProviderId provider) {
  const NativeSpeedRange range = NativeRangeFor(provider);
  return native_speed / range.scale + range.center;
}

double ClampUserSpeed(double user_speed, bool* clamped) {
  const double bounded = std::clamp(user_speed, kMinUserSpeed, kMaxUserSpeed);
  const bool was_clamped = bounded != user_speed;
  if (was_clamped) {
    std::ostringstream oss;
    oss << "[SpeedNormalizer] Speed " << user_speed << " outside ["
        << kMinUserSpeed << ", " << kMaxUserSpeed << "]; using " << bounded;
    Logger::Warn(oss.str());
  }
  if (clamped) *clamped = was_clamped;
  return bounded;
}

}  // namespace dialogcast::speed
