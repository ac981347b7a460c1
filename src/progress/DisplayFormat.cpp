// Repository: encodewatch
// Component: Display Format
// Purpose: Reader-side formatting of progress values, placeholders included.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/DisplayFormat.h"

#include <iomanip>
#include <sstream>

#include "encodewatch/progress/PercentageReconciler.h"
#include "encodewatch/progress/ProgressStore.h"

namespace encodewatch::progress {

const char kPlaceholder[] = "\xE2\x80\x94";
const char kCalculatingPlaceholder[] = "...";

namespace {
constexpr int64_t kUnit = 1024;
constexpr char kUnitPrefixes[] = "KMGTPE";
constexpr double kDisplayCapPercent = 99.9;
constexpr int64_t kMicrosPerSecond = 1'000'000;

std::string FormatToken(const TelemetryToken& token) {
  if (!token.available && !token.raw.empty()) {
    return token.raw;  // the encoder's own "N/A"
  }
  if (token.raw.empty()) {
    return kPlaceholder;
  }
  return token.raw;
}
}  // namespace

std::string FormatBytes(int64_t bytes) {
  if (bytes < kUnit) {
    return std::to_string(bytes) + " B";
  }
  int64_t div = kUnit;
  int exp = 0;
  for (int64_t n = bytes / kUnit; n >= kUnit; n /= kUnit) {
    div *= kUnit;
    ++exp;
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(1)
      << static_cast<double>(bytes) / static_cast<double>(div) << ' ' << kUnitPrefixes[exp]
      << "iB";
  return out.str();
}

std::string FormatDuration(int64_t duration_us) {
  if (duration_us < 0) {
    return kPlaceholder;
  }
  int64_t seconds = (duration_us + kMicrosPerSecond / 2) / kMicrosPerSecond;
  const int64_t hours = seconds / 3600;
  seconds -= hours * 3600;
  const int64_t minutes = seconds / 60;
  seconds -= minutes * 60;

  std::ostringstream out;
  out << std::setfill('0');
  if (hours > 0) {
    out << hours << ':' << std::setw(2) << minutes << ':' << std::setw(2) << seconds;
  } else {
    out << minutes << ':' << std::setw(2) << seconds;
  }
  return out.str();
}

std::string FormatEta(int64_t eta_us, bool available) {
  if (!available || eta_us < 0) {
    return kPlaceholder;
  }
  return FormatDuration(eta_us);
}

std::string FormatPercentage(const ProgressSnapshot& progress) {
  if (!progress.PercentKnown() || !progress.HasProgressData()) {
    return kCalculatingPlaceholder;
  }
  double percent = ClampPercentage(progress.completion_percent);
  if (percent > kDisplayCapPercent) {
    percent = kDisplayCapPercent;
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << percent << '%';
  return out.str();
}

std::string FormatSpeed(const TelemetryToken& speed) {
  // A zero multiplier is what the encoder reports before the first frame.
  if (speed.available && speed.value == 0.0) {
    return kPlaceholder;
  }
  return FormatToken(speed);
}

std::string FormatBitrate(const TelemetryToken& bitrate) { return FormatToken(bitrate); }

std::string FormatSize(int64_t bytes) {
  if (bytes <= 0) {
    return kPlaceholder;
  }
  return FormatBytes(bytes);
}

std::string FormatStatusLine(const SessionState& state) {
  const ProgressSnapshot& p = state.progress;
  std::ostringstream out;
  if (state.done && !state.failed()) {
    out << "100.0%";
  } else {
    out << FormatPercentage(p);
  }
  out << "  frame " << p.current_frame;
  if (p.total_frames > 0) {
    out << '/' << (p.frame_count_estimated ? "~" : "") << p.total_frames;
  }
  out << "  " << std::fixed << std::setprecision(1) << p.current_fps << " fps"
      << "  speed " << FormatSpeed(p.speed)
      << "  bitrate " << FormatBitrate(p.bitrate)
      << "  size " << FormatSize(p.total_output_bytes)
      << "  eta " << FormatEta(p.eta_us, p.eta_available);
  if (state.failed()) {
    out << "  error: " << state.error;
  }
  return out.str();
}

}  // namespace encodewatch::progress
