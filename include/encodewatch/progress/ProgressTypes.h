// Repository: encodewatch
// Component: Progress Types
// Purpose: Progress record shared between the telemetry pipeline and its readers.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_PROGRESS_TYPES_H_
#define ENCODEWATCH_PROGRESS_PROGRESS_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>

namespace encodewatch::progress {

// Sentinel stored in ProgressSnapshot::eta_us when no estimate is available.
constexpr int64_t kEtaUnavailableUs = -1;

// Source frame rate assumed when probing yields nothing usable.
constexpr double kDefaultSourceFps = 24.0;

// TelemetryToken keeps a verbatim telemetry value next to its interpretation.
// An "N/A" token is captured with raw == "N/A" and available == false; callers
// decide on `available`, never on the spelling of `raw`.
// Bitrate tokens carry no numeric value (value stays 0).
struct TelemetryToken {
  bool available = false;
  double value = 0.0;
  std::string raw;
};

// ProgressSnapshot is the authoritative state of one encode run.
struct ProgressSnapshot {
  int64_t current_frame = 0;
  double current_fps = 0.0;
  double last_valid_fps = 0.0;
  TelemetryToken bitrate;
  int64_t total_output_bytes = 0;
  int64_t elapsed_media_us = 0;
  TelemetryToken speed;
  double last_valid_speed = 0.0;
  double completion_percent = 0.0;

  int64_t total_frames = 0;            // 0 = unknown
  bool frame_count_estimated = false;
  int64_t total_duration_us = 0;       // 0 = unknown
  double source_fps = 0.0;
  bool source_fps_is_fallback = false;

  int64_t eta_us = kEtaUnavailableUs;
  bool eta_available = false;

  int64_t run_start_utc_us = 0;        // 0 = run not started

  // A percentage can only mean something once a total is known; until then
  // readers show a placeholder instead of 0%.
  bool PercentKnown() const { return total_frames > 0 || total_duration_us > 0; }

  // Neither percentage candidate is valid until a frame or media time arrives.
  bool HasProgressData() const { return current_frame > 0 || elapsed_media_us > 0; }
};

// ProgressBatch is one group of telemetry updates between two
// `progress=` markers. Absent fields leave the stored value untouched.
struct ProgressBatch {
  std::optional<int64_t> frame;
  std::optional<double> fps;
  std::optional<TelemetryToken> bitrate;
  std::optional<int64_t> total_size;
  std::optional<int64_t> out_time_us;
  std::optional<TelemetryToken> speed;

  // Set when the batch was closed by `progress=end`.
  bool terminal = false;

  bool Empty() const {
    return !frame && !fps && !bitrate && !total_size && !out_time_us && !speed;
  }
};

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_PROGRESS_TYPES_H_
