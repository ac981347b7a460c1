// Repository: encodewatch
// Component: Progress Store
// Purpose: Mutex-guarded progress record written by the pumps, read by copy.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/ProgressStore.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "encodewatch/progress/DiagnosticScanner.h"
#include "encodewatch/progress/LineParser.h"
#include "encodewatch/timing/MasterClock.h"
#include "encodewatch/util/Logger.h"

namespace encodewatch::progress {

namespace {
constexpr double kMicrosPerSecond = 1'000'000.0;
}  // namespace

ProgressStore::ProgressStore(std::shared_ptr<timing::MasterClock> clock, StoreConfig config)
    : clock_(std::move(clock)),
      config_(std::move(config)),
      frame_estimator_(config_.frames),
      reconciler_(config_.reconciler),
      eta_estimator_(config_.eta),
      run_started_(false),
      run_start_monotonic_s_(0.0),
      finalized_(false),
      done_(false),
      batches_applied_(0),
      batches_rejected_(0) {}

void ProgressStore::BeginRun() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (run_started_ || !clock_) {
    return;
  }
  run_started_ = true;
  progress_.run_start_utc_us = clock_->now_utc_us();
  run_start_monotonic_s_ = clock_->now_monotonic_s();
}

void ProgressStore::ApplyEstimate(const FrameEstimate& estimate) {
  std::lock_guard<std::mutex> lock(mutex_);
  progress_.total_frames = estimate.total_frames;
  progress_.frame_count_estimated = estimate.estimated;
  progress_.total_duration_us = estimate.total_duration_us;
  progress_.source_fps = estimate.source_fps;
  progress_.source_fps_is_fallback = estimate.fps_is_fallback;
}

bool ProgressStore::ApplyBatch(const ProgressBatch& batch) {
  std::lock_guard<std::mutex> lock(mutex_);

  const int64_t frame = batch.frame.value_or(progress_.current_frame);
  const double fps = batch.fps.value_or(progress_.current_fps);
  const int64_t size = batch.total_size.value_or(progress_.total_output_bytes);
  if (!ValidateSample(frame, fps, size)) {
    ++batches_rejected_;
    util::Logger::Debug("[ProgressStore] Rejected batch with negative frame/fps/size");
    return false;
  }

  if (batch.frame) {
    progress_.current_frame = std::max(progress_.current_frame, frame);
    FrameEstimator::ReviseForObservedFrame(progress_.current_frame, progress_);
  }

  if (batch.fps) {
    progress_.current_fps = fps;
    if (fps > 0.0) {
      progress_.last_valid_fps = fps;
    }
  }

  if (batch.bitrate) {
    progress_.bitrate = *batch.bitrate;
  }

  if (batch.total_size) {
    progress_.total_output_bytes = std::max(progress_.total_output_bytes, size);
  }

  if (batch.out_time_us && *batch.out_time_us >= 0) {
    progress_.elapsed_media_us = std::max(progress_.elapsed_media_us, *batch.out_time_us);
  }

  if (batch.speed) {
    // An unavailable speed keeps last_valid_speed for the ETA.
    progress_.speed = *batch.speed;
    if (batch.speed->available && batch.speed->value > 0.0) {
      progress_.last_valid_speed = batch.speed->value;
    }
  }

  ++batches_applied_;
  RecomputeLocked(/*update_eta=*/true);

  if (batch.terminal) {
    FinalizeLocked();
  }
  return true;
}

void ProgressStore::ApplyDiagnosticLine(const std::string& line) {
  const DiagnosticHints hints = ScanDiagnosticLine(line);

  std::lock_guard<std::mutex> lock(mutex_);
  bool changed = false;
  if (hints.duration_us && frame_estimator_.ApplyLateDuration(*hints.duration_us, progress_)) {
    util::Logger::Debug("[ProgressStore] Duration from diagnostics: " +
                        std::to_string(*hints.duration_us) + "us");
    changed = true;
  }
  if (hints.frame_rate && frame_estimator_.ApplyLateFrameRate(*hints.frame_rate, progress_)) {
    changed = true;
  }
  if (changed) {
    RecomputeLocked(/*update_eta=*/false);
  }
  if (hints.loggable) {
    AppendLogLocked(line);
  }
}

void ProgressStore::AppendLog(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  AppendLogLocked(line);
}

void ProgressStore::Finalize() {
  std::lock_guard<std::mutex> lock(mutex_);
  FinalizeLocked();
}

void ProgressStore::CompleteRun() {
  std::lock_guard<std::mutex> lock(mutex_);
  FinalizeLocked();
  done_ = true;
  AppendLogLocked("Encoding completed successfully!");
}

void ProgressStore::FailRun(const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  done_ = true;
  error_ = error;
  AppendLogLocked("Encoding error: " + error);
  util::Logger::Error("[ProgressStore] Run failed: " + error);
}

SessionState ProgressStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  SessionState state;
  state.progress = progress_;
  state.log.assign(log_.begin(), log_.end());
  state.done = done_;
  state.error = error_;
  return state;
}

ProgressSnapshot ProgressStore::Progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return progress_;
}

uint64_t ProgressStore::batches_applied() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return batches_applied_;
}

uint64_t ProgressStore::batches_rejected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return batches_rejected_;
}

void ProgressStore::RecomputeLocked(bool update_eta) {
  if (finalized_) {
    return;
  }
  progress_.completion_percent = reconciler_.Reconcile(progress_).percent;
  if (update_eta) {
    eta_estimator_.Update(progress_, ElapsedRunLocked());
  }
}

void ProgressStore::FinalizeLocked() {
  if (progress_.current_frame > 0) {
    progress_.total_frames = progress_.current_frame;
    progress_.frame_count_estimated = false;
  }
  progress_.completion_percent = 100.0;
  progress_.eta_us = kEtaUnavailableUs;
  progress_.eta_available = false;
  finalized_ = true;
}

void ProgressStore::AppendLogLocked(const std::string& line) {
  log_.push_back(line);
  while (log_.size() > config_.max_log_lines) {
    log_.pop_front();
  }
}

std::optional<int64_t> ProgressStore::ElapsedRunLocked() const {
  if (!run_started_ || !clock_) {
    return std::nullopt;
  }
  // Monotonic, so wall clock steps cannot reopen or skip the warm-up window.
  const double elapsed_s = clock_->now_monotonic_s() - run_start_monotonic_s_;
  return std::max<int64_t>(0, static_cast<int64_t>(std::llround(elapsed_s * kMicrosPerSecond)));
}

}  // namespace encodewatch::progress
