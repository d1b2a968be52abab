// Repository: DialogCast
// Component: SpeedNormalizer
// Purpose: Converts the shared user-facing speed knob into each provider's
//          native speed parameter and back (for labeling).
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_SPEED_SPEED_NORMALIZER_HPP_
#define DIALOGCAST_SPEED_SPEED_NORMALIZER_HPP_

#include "dialogcast/providers/ProviderId.hpp"

namespace dialogcast::speed {

// Shared user scale, identical for every provider so that labels compare.
constexpr double kMinUserSpeed = 0.7;
constexpr double kDefaultUserSpeed = 1.0;
constexpr double kMaxUserSpeed = 1.2;

// Native parameter space of one provider:
//   native = (user - center) * scale, clamped to [min_native, max_native].
// scale == 1 and center == 0 is the identity mapping.
struct NativeSpeedRange {
  double min_native;
  double max_native;
  double center;
  double scale;
};

// ElevenLabs: voice_settings.speed in [0.7, 1.2], identity.
// Cartesia:   __experimental_controls.speed in [-1, 1], (user - 1) * 2.
NativeSpeedRange NativeRangeFor(providers::ProviderId provider);

// Out-of-range results are clamped to the provider bounds and a warning is
// logged; *clamped (optional) reports whether that happened.
double ToProviderSpeed(double user_speed, providers::ProviderId provider,
                       bool* clamped = nullptr);

// Exact inverse of ToProviderSpeed inside the native range. Used only for
// human-readable labels; always on the shared user scale.
double ToDisplaySpeed(double native_speed, providers::ProviderId provider);

// Clamps CLI/config input onto [kMinUserSpeed, kMaxUserSpeed] with a warning.
double ClampUserSpeed(double user_speed, bool* clamped = nullptr);

}  // namespace dialogcast::speed

#endif  // DIALOGCAST_SPEED_SPEED_NORMALIZER_HPP_
