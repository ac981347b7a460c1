// Repository: encodewatch
// Component: Display Format
// Purpose: Reader-side formatting of progress values, placeholders included.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_DISPLAY_FORMAT_H_
#define ENCODEWATCH_PROGRESS_DISPLAY_FORMAT_H_

#include <cstdint>
#include <string>

#include "encodewatch/progress/ProgressTypes.h"

namespace encodewatch::progress {

struct SessionState;

// Shown for values that are not known yet.
extern const char kPlaceholder[];
// Shown instead of a percentage while no total is known.
extern const char kCalculatingPlaceholder[];

// Binary units: "0 B", "1023 B", "1.0 KiB", "1.5 MiB", ...
std::string FormatBytes(int64_t bytes);

// "M:SS" or "H:MM:SS", rounded to the second. Negative durations render as
// the placeholder.
std::string FormatDuration(int64_t duration_us);

std::string FormatEta(int64_t eta_us, bool available);

// Presentation only: the stored value is never capped. Shows "..." until a
// total is known and the first frame or media time has been reported, and caps
// at 99.9% so 100% only appears with the done state.
std::string FormatPercentage(const ProgressSnapshot& progress);

std::string FormatSpeed(const TelemetryToken& speed);
std::string FormatBitrate(const TelemetryToken& bitrate);
std::string FormatSize(int64_t bytes);

// One-line status used by the console front end.
std::string FormatStatusLine(const SessionState& state);

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_DISPLAY_FORMAT_H_
