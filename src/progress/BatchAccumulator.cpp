// Repository: encodewatch
// Component: Batch Accumulator
// Purpose: Groups key=value telemetry lines into atomic progress batches.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/BatchAccumulator.h"

#include <limits>

#include "encodewatch/progress/LineParser.h"
#include "encodewatch/util/Logger.h"

namespace encodewatch::progress {

namespace {
constexpr char kBoundaryKey[] = "progress";
constexpr char kTerminalMarker[] = "end";
constexpr int64_t kMicrosPerMilli = 1'000;
}  // namespace

std::optional<ProgressBatch> BatchAccumulator::Feed(const std::string& line) {
  std::string key;
  std::string value;
  if (!ParseKeyValue(line, key, value)) {
    return std::nullopt;
  }

  if (key == kBoundaryKey) {
    ProgressBatch batch = TakeBatch();
    batch.terminal = (value == kTerminalMarker);
    return batch;
  }

  if (key == "frame") {
    const auto frame = ParseInt64(value);
    if (frame && *frame >= 0) {
      pending_.frame = *frame;
    } else {
      Reject(key, value);
    }
  } else if (key == "fps") {
    const auto fps = ParseDouble(value);
    if (fps && *fps >= 0.0) {
      pending_.fps = *fps;
    } else {
      Reject(key, value);
    }
  } else if (key == "bitrate") {
    if (auto token = ParseBitrateValue(value)) {
      pending_.bitrate = std::move(*token);
    } else {
      Reject(key, value);
    }
  } else if (key == "total_size") {
    const auto size = ParseInt64(value);
    if (size && *size >= 0) {
      pending_.total_size = *size;
    } else {
      Reject(key, value);
    }
  } else if (key == "out_time_us") {
    const auto us = ParseInt64(value);
    if (us && *us >= 0) {
      out_time_us_ = *us;
    } else {
      Reject(key, value);
    }
  } else if (key == "out_time_ms") {
    const auto ms = ParseInt64(value);
    if (ms && *ms >= 0 && *ms <= std::numeric_limits<int64_t>::max() / kMicrosPerMilli) {
      out_time_ms_us_ = *ms * kMicrosPerMilli;
    } else {
      Reject(key, value);
    }
  } else if (key == "out_time") {
    const int64_t us = ParseTimestampUs(value);
    if (us >= 0) {
      out_time_text_us_ = us;
    } else {
      Reject(key, value);
    }
  } else if (key == "speed") {
    if (auto token = ParseSpeedValue(value)) {
      pending_.speed = std::move(*token);
    } else {
      Reject(key, value);
    }
  }

  return std::nullopt;
}

std::optional<ProgressBatch> BatchAccumulator::Flush() {
  if (!pending_.frame && !pending_.fps && !pending_.total_size) {
    TakeBatch();
    return std::nullopt;
  }
  return TakeBatch();
}

ProgressBatch BatchAccumulator::TakeBatch() {
  if (out_time_us_) {
    pending_.out_time_us = out_time_us_;
  } else if (out_time_text_us_) {
    pending_.out_time_us = out_time_text_us_;
  } else if (out_time_ms_us_) {
    pending_.out_time_us = out_time_ms_us_;
  }

  ProgressBatch batch = std::move(pending_);
  pending_ = ProgressBatch();
  out_time_us_.reset();
  out_time_text_us_.reset();
  out_time_ms_us_.reset();
  return batch;
}

void BatchAccumulator::Reject(const std::string& key, const std::string& value) {
  ++rejected_values_;
  util::Logger::Debug("[BatchAccumulator] Dropped " + key + "='" + value + "'");
}

}  // namespace encodewatch::progress
