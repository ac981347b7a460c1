// Repository: encodewatch
// Component: Percentage Reconciler
// Purpose: Combines frame-based and time-based completion into one percentage.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_PERCENTAGE_RECONCILER_H_
#define ENCODEWATCH_PROGRESS_PERCENTAGE_RECONCILER_H_

#include <cstdint>
#include <optional>

#include "encodewatch/progress/ProgressTypes.h"

namespace encodewatch::progress {

// Clamps to [0, 100]. NaN maps to 0.
double ClampPercentage(double percent);

// part / whole x 100, or 0 when whole <= 0.
double SafePercent(double part, double whole);

// current / total x 100, valid only when both are positive. Not clamped.
std::optional<double> FrameBasedPercent(int64_t current_frame, int64_t total_frames);

// elapsed / total x 100, valid only when both are positive. Not clamped.
std::optional<double> TimeBasedPercent(int64_t elapsed_media_us, int64_t total_duration_us);

// Tuned, not derived.
struct ReconcilerConfig {
  double disagreement_threshold_points = 10.0;
};

// PercentageReconciler picks the authoritative completion percentage.
//
// With both candidates valid the time-based one wins when the frame total is
// estimated or the candidates differ by more than the threshold; container
// durations are usually exact where frame totals are extrapolated. Otherwise
// whichever candidate is valid is used, and 0 when neither is. The result is
// always clamped.
class PercentageReconciler {
 public:
  enum class Source { kNone, kFrames, kTime };

  struct Result {
    double percent = 0.0;
    Source source = Source::kNone;
  };

  explicit PercentageReconciler(ReconcilerConfig config = ReconcilerConfig());

  Result Reconcile(const ProgressSnapshot& snapshot) const;

  const ReconcilerConfig& config() const { return config_; }

 private:
  ReconcilerConfig config_;
};

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_PERCENTAGE_RECONCILER_H_
