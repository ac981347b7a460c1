// Repository: encodewatch
// Component: ETA Estimator
// Purpose: Remaining-time estimation with tiered fallback and smoothing.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/EtaEstimator.h"

#include <cmath>

namespace encodewatch::progress {

namespace {

constexpr double kMicrosPerSecond = 1'000'000.0;

int64_t ToMicros(double value_us) {
  if (!std::isfinite(value_us) || value_us < 0.0) {
    return kEtaUnavailableUs;
  }
  return static_cast<int64_t>(std::llround(value_us));
}

}  // namespace

int64_t SpeedTierEtaUs(int64_t remaining_media_us, double speed) {
  if (remaining_media_us <= 0 || !(speed > 0.0)) {
    return kEtaUnavailableUs;
  }
  return ToMicros(static_cast<double>(remaining_media_us) / speed);
}

int64_t FrameTierEtaUs(int64_t remaining_frames, double fps) {
  if (remaining_frames <= 0 || !(fps > 0.0)) {
    return kEtaUnavailableUs;
  }
  return ToMicros(static_cast<double>(remaining_frames) / fps * kMicrosPerSecond);
}

int64_t ExtrapolatedEtaUs(int64_t elapsed_us, double percent) {
  if (elapsed_us <= 0 || !(percent > 0.0) || percent >= 100.0) {
    return kEtaUnavailableUs;
  }
  return ToMicros(static_cast<double>(elapsed_us) * (100.0 - percent) / percent);
}

EtaEstimator::EtaEstimator(EtaConfig config) : config_(config) {}

EtaEstimator::Sample EtaEstimator::ComputeRaw(const ProgressSnapshot& snapshot,
                                              std::optional<int64_t> elapsed_wall_us) const {
  Sample sample;

  if (elapsed_wall_us && *elapsed_wall_us < config_.warmup_us) {
    sample.tier = Tier::kWarmup;
    return sample;
  }

  if (snapshot.last_valid_speed > 0.0 && snapshot.total_duration_us > 0 &&
      snapshot.elapsed_media_us > 0) {
    const int64_t eta = SpeedTierEtaUs(snapshot.total_duration_us - snapshot.elapsed_media_us,
                                       snapshot.last_valid_speed);
    if (eta != kEtaUnavailableUs) {
      sample.tier = Tier::kSpeed;
      sample.eta_us = eta;
      return sample;
    }
  }

  // An extrapolated frame total makes the frame-rate tier unreliable.
  if (!snapshot.frame_count_estimated && snapshot.total_frames > 0 &&
      snapshot.current_frame > 0) {
    const int64_t eta = FrameTierEtaUs(snapshot.total_frames - snapshot.current_frame,
                                       snapshot.last_valid_fps);
    if (eta != kEtaUnavailableUs) {
      sample.tier = Tier::kFrameRate;
      sample.eta_us = eta;
      return sample;
    }
  }

  if (elapsed_wall_us && snapshot.completion_percent > config_.extrapolation_min_percent &&
      *elapsed_wall_us > config_.extrapolation_min_elapsed_us) {
    const int64_t eta = ExtrapolatedEtaUs(*elapsed_wall_us, snapshot.completion_percent);
    if (eta != kEtaUnavailableUs) {
      sample.tier = Tier::kExtrapolation;
      sample.eta_us = eta;
      return sample;
    }
  }

  return sample;
}

int64_t EtaEstimator::Smooth(int64_t previous_us, int64_t sample_us) const {
  const double previous = static_cast<double>(previous_us);
  const double sample = static_cast<double>(sample_us);
  const double jump = std::fabs(sample - previous);
  const double weight = jump > previous * config_.outlier_jump_ratio
                            ? config_.outlier_smoothing_weight
                            : config_.smoothing_weight;
  return static_cast<int64_t>(std::llround(sample * weight + previous * (1.0 - weight)));
}

EtaEstimator::Tier EtaEstimator::Update(ProgressSnapshot& snapshot,
                                        std::optional<int64_t> elapsed_wall_us) const {
  const Sample sample = ComputeRaw(snapshot, elapsed_wall_us);
  if (sample.eta_us == kEtaUnavailableUs) {
    snapshot.eta_available = false;
    snapshot.eta_us = kEtaUnavailableUs;
    return sample.tier;
  }

  if (snapshot.eta_available && snapshot.eta_us > 0) {
    snapshot.eta_us = Smooth(snapshot.eta_us, sample.eta_us);
  } else {
    snapshot.eta_us = sample.eta_us;
  }
  snapshot.eta_available = true;
  return sample.tier;
}

const char* EtaTierToString(EtaEstimator::Tier tier) {
  switch (tier) {
    case EtaEstimator::Tier::kNone:
      return "none";
    case EtaEstimator::Tier::kWarmup:
      return "warmup";
    case EtaEstimator::Tier::kSpeed:
      return "speed";
    case EtaEstimator::Tier::kFrameRate:
      return "frame_rate";
    case EtaEstimator::Tier::kExtrapolation:
      return "extrapolation";
  }
  return "none";
}

}  // namespace encodewatch::progress
