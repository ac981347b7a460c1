// Repository: encodewatch
// Component: Frame Estimator
// Purpose: Establishes the expected total frame count and source frame rate.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_FRAME_ESTIMATOR_H_
#define ENCODEWATCH_PROGRESS_FRAME_ESTIMATOR_H_

#include <cstdint>
#include <optional>

#include "encodewatch/progress/ProgressTypes.h"

namespace encodewatch::probe {
class MediaProbe;
}

namespace encodewatch::progress {

struct FrameEstimatorConfig {
  double default_fps = kDefaultSourceFps;
  // Durations beyond this are kept for the time-based percentage but never
  // extrapolated into a frame count.
  double max_estimable_duration_s = 24.0 * 3600.0;
  int64_t max_estimated_frames = 100'000'000;
  double max_source_fps = 1000.0;
};

// Outcome of the pre-stream probe.
struct FrameEstimate {
  enum class Source {
    kUnknown,          // no count and no duration
    kContainerCount,   // exact count from container metadata
    kDuration,         // duration x frame rate
    kDurationOnly,     // duration known but not extrapolated
  };

  Source source = Source::kUnknown;
  int64_t total_frames = 0;
  bool estimated = false;
  int64_t total_duration_us = 0;
  double source_fps = 0.0;
  bool fps_is_fallback = false;
};

// FrameEstimator runs the fallback chain once per run:
//   1. real frame rate, then average frame rate, then the default (flagged);
//   2. container frame count (exact, stops here);
//   3. container duration (unknown when unavailable, logged once);
//   4. durations over the sanity limit keep the duration only;
//   5. otherwise round(duration x fps), subject to the frame ceiling.
//
// It also owns the live revisions applied while the run streams.
class FrameEstimator {
 public:
  explicit FrameEstimator(FrameEstimatorConfig config = FrameEstimatorConfig());

  FrameEstimate Estimate(probe::MediaProbe& probe) const;

  // round(duration_s x fps) when both are positive, the fps is plausible and
  // the result lies below the frame ceiling.
  std::optional<int64_t> EstimateTotalFrames(double duration_s, double fps) const;

  // Raises total_frames to an observed frame number that overtook it.
  // Only applies once a positive total is known; the result is re-marked
  // estimated. Returns true when the snapshot changed.
  static bool ReviseForObservedFrame(int64_t observed_frame, ProgressSnapshot& snapshot);

  // Called when the duration is learnt after streaming started. Derives an
  // estimate unless an exact count is already established.
  bool ApplyLateDuration(int64_t duration_us, ProgressSnapshot& snapshot) const;

  // Called when a frame-rate hint replaces the fallback rate. Re-derives the
  // estimate from a known duration unless an exact count exists.
  bool ApplyLateFrameRate(double fps, ProgressSnapshot& snapshot) const;

  const FrameEstimatorConfig& config() const { return config_; }

 private:
  // Derives total_frames from the snapshot's duration and source rate.
  bool Reestimate(ProgressSnapshot& snapshot) const;

  FrameEstimatorConfig config_;
};

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_FRAME_ESTIMATOR_H_
