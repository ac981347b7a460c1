#include "timing/TestMasterClock.h"

#include <cmath>

namespace encodewatch::timing {

namespace {
constexpr double kMillion = 1'000'000.0;
}

TestMasterClock::TestMasterClock() : utc_us_(0), monotonic_s_(0.0) {}

TestMasterClock::TestMasterClock(int64_t start_time_us)
    : utc_us_(start_time_us),
      monotonic_s_(static_cast<double>(start_time_us) / kMillion) {}

int64_t TestMasterClock::now_utc_us() const {
  return utc_us_.load(std::memory_order_acquire);
}

double TestMasterClock::now_monotonic_s() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return monotonic_s_;
}

void TestMasterClock::SetNow(int64_t utc_us, double monotonic_s) {
  std::lock_guard<std::mutex> lock(mutex_);
  utc_us_.store(utc_us, std::memory_order_release);
  monotonic_s_ = monotonic_s;
}

void TestMasterClock::AdvanceMicroseconds(int64_t delta_us) {
  std::lock_guard<std::mutex> lock(mutex_);
  utc_us_.fetch_add(delta_us, std::memory_order_acq_rel);
  monotonic_s_ += static_cast<double>(delta_us) / kMillion;
}

void TestMasterClock::AdvanceSeconds(double delta_s) {
  AdvanceMicroseconds(static_cast<int64_t>(std::llround(delta_s * kMillion)));
}

}  // namespace encodewatch::timing
