// Repository: encodewatch
// Component: Progress Store
// Purpose: Mutex-guarded progress record written by the pumps, read by copy.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_PROGRESS_STORE_H_
#define ENCODEWATCH_PROGRESS_PROGRESS_STORE_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "encodewatch/progress/EtaEstimator.h"
#include "encodewatch/progress/FrameEstimator.h"
#include "encodewatch/progress/PercentageReconciler.h"
#include "encodewatch/progress/ProgressTypes.h"

namespace encodewatch::timing {
class MasterClock;
}

namespace encodewatch::progress {

// SessionState is everything a reader needs: a copy of the progress record,
// the bounded diagnostic log and the completion / error flag.
struct SessionState {
  ProgressSnapshot progress;
  std::vector<std::string> log;
  bool done = false;
  std::string error;  // empty unless the run failed

  bool failed() const { return !error.empty(); }
};

struct StoreConfig {
  std::size_t max_log_lines = 100;
  FrameEstimatorConfig frames;
  ReconcilerConfig reconciler;
  EtaConfig eta;
};

// ProgressStore owns the single ProgressSnapshot of a run.
//
// Mutations (ApplyBatch, ApplyDiagnosticLine, Finalize, ...) are issued by the
// stream pumps and the exit waiter; Snapshot() may be called from any number
// of reader threads. Every operation takes the same mutex and readers only
// ever receive copies, so a reader sees either none or all of a batch.
// The diagnostic log lives under the same mutex.
class ProgressStore {
 public:
  explicit ProgressStore(std::shared_ptr<timing::MasterClock> clock,
                         StoreConfig config = StoreConfig());

  ProgressStore(const ProgressStore&) = delete;
  ProgressStore& operator=(const ProgressStore&) = delete;

  // Stamps the run start (UTC for display, monotonic for elapsed run time).
  // Only the first call has an effect.
  void BeginRun();

  // Installs the pre-stream frame estimate.
  void ApplyEstimate(const FrameEstimate& estimate);

  // Applies one telemetry batch atomically and recomputes the percentage and
  // ETA. A batch whose frame, fps or size would go negative is rejected and
  // the previous values are kept. A terminal batch also finalizes the run.
  bool ApplyBatch(const ProgressBatch& batch);

  // Scans one stderr line for duration / frame-rate hints (first write wins)
  // and appends it to the diagnostic log when it is not a stats line.
  void ApplyDiagnosticLine(const std::string& line);

  void AppendLog(const std::string& line);

  // Total = observed frames when positive, 100%, ETA unavailable.
  void Finalize();

  // Normal process exit: finalizes and marks the run done.
  void CompleteRun();

  // Spawn failure or non-zero exit: marks the run done with `error`.
  // Progress is left as it was.
  void FailRun(const std::string& error);

  [[nodiscard]] SessionState Snapshot() const;
  [[nodiscard]] ProgressSnapshot Progress() const;

  uint64_t batches_applied() const;
  uint64_t batches_rejected() const;

 private:
  void RecomputeLocked(bool update_eta);
  void FinalizeLocked();
  void AppendLogLocked(const std::string& line);
  std::optional<int64_t> ElapsedRunLocked() const;

  std::shared_ptr<timing::MasterClock> clock_;
  const StoreConfig config_;
  const FrameEstimator frame_estimator_;
  const PercentageReconciler reconciler_;
  const EtaEstimator eta_estimator_;

  mutable std::mutex mutex_;
  ProgressSnapshot progress_;
  std::deque<std::string> log_;
  bool run_started_;
  double run_start_monotonic_s_;
  bool finalized_;
  bool done_;
  std::string error_;
  uint64_t batches_applied_;
  uint64_t batches_rejected_;
};

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_PROGRESS_STORE_H_
