// Repository: encodewatch
// Component: Percentage Reconciler
// Purpose: Combines frame-based and time-based completion into one percentage.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/PercentageReconciler.h"

#include <cmath>

namespace encodewatch::progress {

double ClampPercentage(double percent) {
  if (std::isnan(percent) || percent < 0.0) {
    return 0.0;
  }
  if (percent > 100.0) {
    return 100.0;
  }
  return percent;
}

double SafePercent(double part, double whole) {
  if (!(whole > 0.0)) {
    return 0.0;
  }
  return part / whole * 100.0;
}

std::optional<double> FrameBasedPercent(int64_t current_frame, int64_t total_frames) {
  if (total_frames <= 0 || current_frame <= 0) {
    return std::nullopt;
  }
  return SafePercent(static_cast<double>(current_frame), static_cast<double>(total_frames));
}

std::optional<double> TimeBasedPercent(int64_t elapsed_media_us, int64_t total_duration_us) {
  if (total_duration_us <= 0 || elapsed_media_us <= 0) {
    return std::nullopt;
  }
  return SafePercent(static_cast<double>(elapsed_media_us),
                     static_cast<double>(total_duration_us));
}

PercentageReconciler::PercentageReconciler(ReconcilerConfig config) : config_(config) {}

PercentageReconciler::Result PercentageReconciler::Reconcile(
    const ProgressSnapshot& snapshot) const {
  const auto by_frames = FrameBasedPercent(snapshot.current_frame, snapshot.total_frames);
  const auto by_time = TimeBasedPercent(snapshot.elapsed_media_us, snapshot.total_duration_us);

  Result result;
  if (by_frames && by_time) {
    const double diff = std::fabs(*by_frames - *by_time);
    if (diff > config_.disagreement_threshold_points || snapshot.frame_count_estimated) {
      result.percent = *by_time;
      result.source = Source::kTime;
    } else {
      result.percent = *by_frames;
      result.source = Source::kFrames;
    }
  } else if (by_time) {
    result.percent = *by_time;
    result.source = Source::kTime;
  } else if (by_frames) {
    result.percent = *by_frames;
    result.source = Source::kFrames;
  }

  result.percent = ClampPercentage(result.percent);
  return result;
}

}  // namespace encodewatch::progress
