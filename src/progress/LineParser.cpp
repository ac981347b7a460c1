// Repository: encodewatch
// Component: Line Parser
// Purpose: Stateless typed extraction from telemetry and probe output lines.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/LineParser.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>

namespace encodewatch::progress {

namespace {

constexpr std::string_view kNotAvailable = "N/A";
constexpr int64_t kMicrosPerSecond = 1'000'000;
constexpr size_t kFractionDigits = 6;
// Largest whole-second count whose microsecond value (plus a fraction) fits.
constexpr int64_t kMaxTimestampSeconds =
    (std::numeric_limits<int64_t>::max() - kMicrosPerSecond) / kMicrosPerSecond;

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool AllDigits(std::string_view text) {
  if (text.empty()) return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool DigitsAndDots(std::string_view text) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c != '.' && !std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

TelemetryToken NotAvailableToken() {
  TelemetryToken token;
  token.available = false;
  token.value = 0.0;
  token.raw = std::string(kNotAvailable);
  return token;
}

}  // namespace

std::string Trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && IsSpace(text[begin])) ++begin;
  while (end > begin && IsSpace(text[end - 1])) --end;
  return std::string(text.substr(begin, end - begin));
}

bool ParseKeyValue(std::string_view line, std::string& key, std::string& value) {
  const size_t eq = line.find('=');
  if (eq == std::string_view::npos) {
    return false;
  }
  key = Trim(line.substr(0, eq));
  value = Trim(line.substr(eq + 1));
  return !key.empty();
}

std::optional<int64_t> ParseInt64(std::string_view text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;

  errno = 0;
  char* end = nullptr;
  const long long parsed = std::strtoll(trimmed.c_str(), &end, 10);
  if (errno == ERANGE || end != trimmed.c_str() + trimmed.size()) {
    return std::nullopt;
  }
  return static_cast<int64_t>(parsed);
}

std::optional<double> ParseDouble(std::string_view text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;

  errno = 0;
  char* end = nullptr;
  const double parsed = std::strtod(trimmed.c_str(), &end);
  if (errno == ERANGE || end != trimmed.c_str() + trimmed.size() ||
      !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

double ParseFrameRate(std::string_view text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return 0.0;
  }

  const size_t slash = trimmed.find('/');
  if (slash == std::string::npos) {
    return ParseDouble(trimmed).value_or(0.0);
  }

  const std::string_view view(trimmed);
  const auto num = ParseDouble(view.substr(0, slash));
  const auto den = ParseDouble(view.substr(slash + 1));
  if (!num || !den || *den <= 0.0) {
    return 0.0;
  }
  return *num / *den;
}

std::optional<TelemetryToken> ParseSpeedValue(std::string_view value) {
  const std::string trimmed = Trim(value);
  if (trimmed == kNotAvailable) {
    return NotAvailableToken();
  }
  if (trimmed.size() < 2 || trimmed.back() != 'x') {
    return std::nullopt;
  }

  const std::string_view number(trimmed.data(), trimmed.size() - 1);
  if (!DigitsAndDots(number)) {
    return std::nullopt;  // also rejects a leading '-'
  }
  const auto speed = ParseDouble(number);
  if (!speed || *speed < 0.0) {
    return std::nullopt;
  }

  TelemetryToken token;
  token.available = true;
  token.value = *speed;
  token.raw = trimmed;
  return token;
}

std::optional<TelemetryToken> ParseSpeed(const std::string& line) {
  static const std::regex kSpeedRe(R"(speed=\s*([\d.]+x|N/A)\s*$)");
  std::smatch m;
  if (!std::regex_search(line, m, kSpeedRe)) {
    return std::nullopt;
  }
  return ParseSpeedValue(m[1].str());
}

std::optional<TelemetryToken> ParseBitrateValue(std::string_view value) {
  static const std::regex kBitrateValueRe(R"(^([\d.]+)\s*[kKmMgG]?bits?/s$)");

  const std::string trimmed = Trim(value);
  if (trimmed == kNotAvailable) {
    return NotAvailableToken();
  }

  std::smatch m;
  if (!std::regex_match(trimmed, m, kBitrateValueRe) || !ParseDouble(m[1].str())) {
    return std::nullopt;
  }

  TelemetryToken token;
  token.available = true;
  token.raw = trimmed;
  return token;
}

std::optional<TelemetryToken> ParseBitrate(const std::string& line) {
  static const std::regex kBitrateRe(R"(bitrate=\s*([\d.]+\s*[kKmMgG]?bits?/s|N/A)\s*$)");
  std::smatch m;
  if (!std::regex_search(line, m, kBitrateRe)) {
    return std::nullopt;
  }
  return ParseBitrateValue(m[1].str());
}

int64_t ParseTimestampUs(std::string_view text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty() || trimmed == kNotAvailable) {
    return kInvalidTimestampUs;
  }

  const size_t first = trimmed.find(':');
  const size_t second =
      first == std::string::npos ? std::string::npos : trimmed.find(':', first + 1);
  if (second == std::string::npos || trimmed.find(':', second + 1) != std::string::npos) {
    return kInvalidTimestampUs;
  }

  const std::string_view view(trimmed);
  const std::string_view hours_text = view.substr(0, first);
  const std::string_view minutes_text = view.substr(first + 1, second - first - 1);
  std::string_view seconds_text = view.substr(second + 1);
  std::string_view fraction_text;
  const size_t dot = seconds_text.find('.');
  if (dot != std::string_view::npos) {
    fraction_text = seconds_text.substr(dot + 1);
    seconds_text = seconds_text.substr(0, dot);
  }

  if (!AllDigits(hours_text) || !AllDigits(minutes_text) || !AllDigits(seconds_text)) {
    return kInvalidTimestampUs;
  }
  if (!fraction_text.empty() && !AllDigits(fraction_text)) {
    return kInvalidTimestampUs;
  }

  const auto hours = ParseInt64(hours_text);
  const auto minutes = ParseInt64(minutes_text);
  const auto seconds = ParseInt64(seconds_text);
  if (!hours || !minutes || !seconds) {
    return kInvalidTimestampUs;
  }
  if (*hours > kMaxTimestampSeconds / 3600 || *minutes > kMaxTimestampSeconds / 60 ||
      *seconds > kMaxTimestampSeconds) {
    return kInvalidTimestampUs;
  }
  const int64_t total_seconds = *hours * 3600 + *minutes * 60 + *seconds;
  if (total_seconds > kMaxTimestampSeconds) {
    return kInvalidTimestampUs;
  }

  std::string micros_text(fraction_text.substr(0, kFractionDigits));
  micros_text.append(kFractionDigits - micros_text.size(), '0');
  const int64_t micros = ParseInt64(micros_text).value_or(0);

  return total_seconds * kMicrosPerSecond + micros;
}

bool ValidateSample(int64_t frame, double fps, int64_t size) {
  return frame >= 0 && fps >= 0.0 && size >= 0;
}

}  // namespace encodewatch::progress
