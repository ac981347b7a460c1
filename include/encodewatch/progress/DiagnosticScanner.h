// Repository: encodewatch
// Component: Diagnostic Scanner
// Purpose: Extracts duration and frame-rate hints from the encoder's stderr text.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_DIAGNOSTIC_SCANNER_H_
#define ENCODEWATCH_PROGRESS_DIAGNOSTIC_SCANNER_H_

#include <cstdint>
#include <optional>
#include <string>

namespace encodewatch::progress {

// Hints found on one stderr line.
struct DiagnosticHints {
  std::optional<int64_t> duration_us;  // "Duration: HH:MM:SS.CC"
  std::optional<double> frame_rate;    // "<n> fps", else "<n> tbr"
  bool loggable = false;               // belongs in the diagnostic log
};

// Parses "Duration: 01:02:03.45" (centiseconds) anywhere in the line.
std::optional<int64_t> ParseDurationAnnouncementUs(const std::string& line);

// Parses "23.98 fps" or, failing that, "23.98 tbr". Only 0 < rate < 1000 is
// accepted. Stats lines ("frame= 100 fps= 24 ...") never yield a hint.
std::optional<double> ParseFrameRateHint(const std::string& line);

// True for the periodic stats lines the encoder also prints on stderr.
bool LooksLikeTelemetry(const std::string& line);

DiagnosticHints ScanDiagnosticLine(const std::string& line);

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_DIAGNOSTIC_SCANNER_H_
