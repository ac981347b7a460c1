// Repository: encodewatch
// Component: Batch Accumulator
// Purpose: Groups key=value telemetry lines into atomic progress batches.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_BATCH_ACCUMULATOR_H_
#define ENCODEWATCH_PROGRESS_BATCH_ACCUMULATOR_H_

#include <cstdint>
#include <optional>
#include <string>

#include "encodewatch/progress/ProgressTypes.h"

namespace encodewatch::progress {

// BatchAccumulator consumes the `-progress` stream one line at a time.
//
// Lines are `key=value`; a `progress=continue` or `progress=end` line closes
// the current batch and hands it back. Values that fail to parse are dropped
// so the store keeps its previous value. Unknown keys are ignored.
//
// The three time keys (out_time_us, out_time, out_time_ms) are resolved when
// the batch closes, with that precedence, so a batch carrying all three
// yields exactly one elapsed-media value.
//
// Owned by a single pump thread; not thread-safe.
class BatchAccumulator {
 public:
  BatchAccumulator() = default;

  // Returns the completed batch when `line` is a boundary marker.
  std::optional<ProgressBatch> Feed(const std::string& line);

  // End of stream: returns the pending partial batch if it carries a frame,
  // fps or size update; anything else is discarded.
  std::optional<ProgressBatch> Flush();

  // Number of lines whose value was present but rejected.
  uint64_t rejected_values() const { return rejected_values_; }

 private:
  ProgressBatch TakeBatch();
  void Reject(const std::string& key, const std::string& value);

  ProgressBatch pending_;
  std::optional<int64_t> out_time_us_;
  std::optional<int64_t> out_time_text_us_;
  std::optional<int64_t> out_time_ms_us_;
  uint64_t rejected_values_ = 0;
};

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_BATCH_ACCUMULATOR_H_
