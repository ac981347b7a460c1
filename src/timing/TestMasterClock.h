#ifndef ENCODEWATCH_TIMING_TEST_MASTER_CLOCK_H_
#define ENCODEWATCH_TIMING_TEST_MASTER_CLOCK_H_

#include "encodewatch/timing/MasterClock.h"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace encodewatch::timing {

// TestMasterClock only moves when a test tells it to, so warm-up windows and
// extrapolation floors can be crossed deterministically.
class TestMasterClock : public MasterClock {
 public:
  TestMasterClock();
  explicit TestMasterClock(int64_t start_time_us);

  int64_t now_utc_us() const override;
  double now_monotonic_s() const override;
  bool is_fake() const override { return true; }

  // Time control methods
  void SetNow(int64_t utc_us, double monotonic_s);
  void AdvanceMicroseconds(int64_t delta_us);
  void AdvanceSeconds(double delta_s);

 private:
  mutable std::mutex mutex_;
  std::atomic<int64_t> utc_us_;
  double monotonic_s_;  // Protected by mutex_
};

}  // namespace encodewatch::timing

#endif  // ENCODEWATCH_TIMING_TEST_MASTER_CLOCK_H_
