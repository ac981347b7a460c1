// Repository: encodewatch
// Component: ETA Estimator
// Purpose: Remaining-time estimation with tiered fallback and smoothing.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_ETA_ESTIMATOR_H_
#define ENCODEWATCH_PROGRESS_ETA_ESTIMATOR_H_

#include <cstdint>
#include <optional>

#include "encodewatch/progress/ProgressTypes.h"

namespace encodewatch::progress {

// Weights and thresholds are tuned, not derived.
struct EtaConfig {
  int64_t warmup_us = 5'000'000;
  double extrapolation_min_percent = 2.0;
  int64_t extrapolation_min_elapsed_us = 10'000'000;
  double smoothing_weight = 0.3;          // weight of the new sample
  double outlier_smoothing_weight = 0.2;  // weight of the new sample on a jump
  double outlier_jump_ratio = 0.5;        // jump = |new - old| > ratio x old
};

// Each tier helper returns kEtaUnavailableUs when its denominator or its
// remaining amount is not positive.

// remaining media time / speed multiplier.
int64_t SpeedTierEtaUs(int64_t remaining_media_us, double speed);
// remaining frames / encoding fps.
int64_t FrameTierEtaUs(int64_t remaining_frames, double fps);
// elapsed x (100 - percent) / percent.
int64_t ExtrapolatedEtaUs(int64_t elapsed_us, double percent);

// EtaEstimator runs on every applied batch:
//   warm-up gate -> speed tier -> frame-rate tier -> elapsed extrapolation.
// The frame-rate tier is skipped while the frame total is estimated. A fresh
// sample is blended into the previous available ETA; the first available
// sample of a run is stored as is.
class EtaEstimator {
 public:
  enum class Tier { kNone, kWarmup, kSpeed, kFrameRate, kExtrapolation };

  struct Sample {
    Tier tier = Tier::kNone;
    int64_t eta_us = kEtaUnavailableUs;
  };

  explicit EtaEstimator(EtaConfig config = EtaConfig());

  // `elapsed_wall_us` is the wall time since run start, or nullopt when the
  // run has no start stamp (warm-up and extrapolation are then skipped).
  Sample ComputeRaw(const ProgressSnapshot& snapshot,
                    std::optional<int64_t> elapsed_wall_us) const;

  // Exponential blend of a new sample into the previous value.
  int64_t Smooth(int64_t previous_us, int64_t sample_us) const;

  // Computes, smooths and stores eta_us / eta_available into `snapshot`.
  Tier Update(ProgressSnapshot& snapshot, std::optional<int64_t> elapsed_wall_us) const;

  const EtaConfig& config() const { return config_; }

 private:
  EtaConfig config_;
};

const char* EtaTierToString(EtaEstimator::Tier tier);

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_ETA_ESTIMATOR_H_
