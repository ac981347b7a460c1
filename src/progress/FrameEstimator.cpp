// Repository: encodewatch
// Component: Frame Estimator
// Purpose: Establishes the expected total frame count and source frame rate.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/FrameEstimator.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "encodewatch/probe/MediaProbe.h"
#include "encodewatch/util/Logger.h"

namespace encodewatch::progress {

namespace {
constexpr double kMicrosPerSecond = 1'000'000.0;
}  // namespace

FrameEstimator::FrameEstimator(FrameEstimatorConfig config) : config_(config) {}

FrameEstimate FrameEstimator::Estimate(probe::MediaProbe& probe) const {
  FrameEstimate estimate;

  double fps = 0.0;
  if (const auto rates = probe.ProbeFrameRates()) {
    fps = rates->real_fps;
    if (fps <= 0.0) {
      fps = rates->average_fps;
    }
  }
  if (fps > 0.0 && std::isfinite(fps)) {
    estimate.source_fps = fps;
  } else {
    estimate.source_fps = config_.default_fps;
    estimate.fps_is_fallback = true;
    util::Logger::Warn("[FrameEstimator] Source frame rate unavailable, assuming " +
                       std::to_string(config_.default_fps) + " fps");
  }

  const auto count = probe.ProbeFrameCount();
  if (count && *count > 0) {
    estimate.source = FrameEstimate::Source::kContainerCount;
    estimate.total_frames = *count;
    estimate.estimated = false;
    util::Logger::Info("[FrameEstimator] Container frame count: " + std::to_string(*count));
    return estimate;
  }

  const auto duration_s = probe.ProbeDurationSeconds();
  if (!duration_s || !std::isfinite(*duration_s) || *duration_s <= 0.0) {
    util::Logger::Warn(
        "[FrameEstimator] Total frame count unknown: no frame count or duration in container");
    return estimate;
  }

  estimate.total_duration_us = static_cast<int64_t>(std::llround(*duration_s * kMicrosPerSecond));

  if (*duration_s > config_.max_estimable_duration_s) {
    estimate.source = FrameEstimate::Source::kDurationOnly;
    util::Logger::Warn("[FrameEstimator] Duration " + std::to_string(*duration_s) +
                       "s exceeds sanity limit, not extrapolating a frame count");
    return estimate;
  }

  const auto frames = EstimateTotalFrames(*duration_s, estimate.source_fps);
  if (!frames) {
    estimate.source = FrameEstimate::Source::kDurationOnly;
    return estimate;
  }

  estimate.source = FrameEstimate::Source::kDuration;
  estimate.total_frames = *frames;
  estimate.estimated = true;

  std::ostringstream msg;
  msg << "[FrameEstimator] Estimated " << *frames << " frames from " << *duration_s
      << "s at " << estimate.source_fps << " fps";
  util::Logger::Info(msg.str());
  return estimate;
}

std::optional<int64_t> FrameEstimator::EstimateTotalFrames(double duration_s, double fps) const {
  if (!(duration_s > 0.0) || !(fps > 0.0) || fps >= config_.max_source_fps) {
    return std::nullopt;
  }
  const double frames = std::round(duration_s * fps);
  if (!std::isfinite(frames) || frames <= 0.0 ||
      frames >= static_cast<double>(config_.max_estimated_frames)) {
    return std::nullopt;
  }
  return static_cast<int64_t>(frames);
}

bool FrameEstimator::ReviseForObservedFrame(int64_t observed_frame, ProgressSnapshot& snapshot) {
  if (snapshot.total_frames <= 0 || observed_frame <= snapshot.total_frames) {
    return false;
  }
  // Container counts can be wrong too; the observed frame is a lower bound.
  snapshot.total_frames = observed_frame;
  snapshot.frame_count_estimated = true;
  return true;
}

bool FrameEstimator::ApplyLateDuration(int64_t duration_us, ProgressSnapshot& snapshot) const {
  if (duration_us <= 0 || snapshot.total_duration_us > 0) {
    return false;
  }
  snapshot.total_duration_us = duration_us;
  if (snapshot.total_frames == 0 || snapshot.frame_count_estimated) {
    Reestimate(snapshot);
  }
  return true;
}

bool FrameEstimator::ApplyLateFrameRate(double fps, ProgressSnapshot& snapshot) const {
  if (!(fps > 0.0) || fps >= config_.max_source_fps) {
    return false;
  }
  if (snapshot.source_fps > 0.0 && !snapshot.source_fps_is_fallback) {
    return false;
  }
  snapshot.source_fps = fps;
  snapshot.source_fps_is_fallback = false;
  if (snapshot.total_frames == 0 || snapshot.frame_count_estimated) {
    Reestimate(snapshot);
  }
  return true;
}

bool FrameEstimator::Reestimate(ProgressSnapshot& snapshot) const {
  if (snapshot.total_duration_us <= 0 || snapshot.source_fps <= 0.0) {
    return false;
  }
  const double duration_s = static_cast<double>(snapshot.total_duration_us) / kMicrosPerSecond;
  if (duration_s > config_.max_estimable_duration_s) {
    return false;
  }
  const auto frames = EstimateTotalFrames(duration_s, snapshot.source_fps);
  if (!frames) {
    return false;
  }
  snapshot.total_frames = std::max(*frames, snapshot.current_frame);
  snapshot.frame_count_estimated = true;
  return true;
}

}  // namespace encodewatch::progress
