// Repository: encodewatch
// Component: Diagnostic Scanner
// Purpose: Extracts duration and frame-rate hints from the encoder's stderr text.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/DiagnosticScanner.h"

#include <regex>

#include "encodewatch/progress/LineParser.h"

namespace encodewatch::progress {

namespace {

constexpr double kMaxHintFps = 1000.0;

bool StartsWith(const std::string& line, const char* prefix) {
  return line.rfind(prefix, 0) == 0;
}

std::optional<double> AcceptRate(const std::smatch& m) {
  const auto rate = ParseDouble(m[1].str());
  if (!rate || *rate <= 0.0 || *rate >= kMaxHintFps) {
    return std::nullopt;
  }
  return rate;
}

}  // namespace

std::optional<int64_t> ParseDurationAnnouncementUs(const std::string& line) {
  static const std::regex kDurationRe(R"(Duration: (\d{2}):(\d{2}):(\d{2})\.(\d{2}))");
  std::smatch m;
  if (!std::regex_search(line, m, kDurationRe)) {
    return std::nullopt;
  }
  const int64_t hours = ParseInt64(m[1].str()).value_or(0);
  const int64_t minutes = ParseInt64(m[2].str()).value_or(0);
  const int64_t seconds = ParseInt64(m[3].str()).value_or(0);
  const int64_t centis = ParseInt64(m[4].str()).value_or(0);
  return ((hours * 3600 + minutes * 60 + seconds) * 100 + centis) * 10'000;
}

std::optional<double> ParseFrameRateHint(const std::string& line) {
  if (LooksLikeTelemetry(line)) {
    return std::nullopt;
  }

  static const std::regex kFpsRe(R"((\d+(?:\.\d+)?)\s*fps)");
  static const std::regex kTbrRe(R"((\d+(?:\.\d+)?)\s*tbr)");
  std::smatch m;
  if (std::regex_search(line, m, kFpsRe)) {
    if (auto rate = AcceptRate(m)) return rate;
  }
  if (std::regex_search(line, m, kTbrRe)) {
    return AcceptRate(m);
  }
  return std::nullopt;
}

bool LooksLikeTelemetry(const std::string& line) {
  return StartsWith(line, "frame=") || StartsWith(line, "size=") ||
         StartsWith(line, "fps=");
}

DiagnosticHints ScanDiagnosticLine(const std::string& line) {
  DiagnosticHints hints;
  hints.duration_us = ParseDurationAnnouncementUs(line);
  hints.frame_rate = ParseFrameRateHint(line);
  hints.loggable = !line.empty() && !LooksLikeTelemetry(line);
  return hints;
}

}  // namespace encodewatch::progress
