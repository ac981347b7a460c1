#ifndef ENCODEWATCH_TIMING_MASTER_CLOCK_H_
#define ENCODEWATCH_TIMING_MASTER_CLOCK_H_

#include <cstdint>
#include <memory>

namespace encodewatch::timing {

// MasterClock provides the wall-clock time used to stamp the start of an
// encode run and to measure elapsed run time for ETA warm-up gating and
// elapsed-time extrapolation.
class MasterClock {
 public:
  virtual ~MasterClock() = default;

  // Returns current UTC time in microseconds since Unix epoch.
  virtual int64_t now_utc_us() const = 0;

  // Returns current monotonic time in seconds relative to clock start.
  virtual double now_monotonic_s() const = 0;

  // Returns true if this is a fake/test clock (for testing only).
  virtual bool is_fake() const { return false; }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock();

}  // namespace encodewatch::timing

#endif  // ENCODEWATCH_TIMING_MASTER_CLOCK_H_
