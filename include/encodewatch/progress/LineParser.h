// Repository: encodewatch
// Component: Line Parser
// Purpose: Stateless typed extraction from telemetry and probe output lines.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROGRESS_LINE_PARSER_H_
#define ENCODEWATCH_PROGRESS_LINE_PARSER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "encodewatch/progress/ProgressTypes.h"

namespace encodewatch::progress {

// Returned by ParseTimestampUs on any structural failure.
constexpr int64_t kInvalidTimestampUs = -1;

// None of these functions throw. A malformed input is reported as an empty
// optional / zero / sentinel and the caller keeps its previous value.

std::string Trim(std::string_view text);

// Splits "key=value" at the first '=' and trims both sides.
// Returns false when the line has no '=' or the key is empty.
bool ParseKeyValue(std::string_view line, std::string& key, std::string& value);

// Whole-token numeric parsing; rejects trailing garbage and non-finite values.
std::optional<int64_t> ParseInt64(std::string_view text);
std::optional<double> ParseDouble(std::string_view text);

// Parses "23.976" or "24000/1001". Returns 0 for empty input, for a rational
// whose denominator is <= 0 and for anything that is not numeric.
double ParseFrameRate(std::string_view text);

// Speed value "1.5x" or "N/A". Negative numbers are rejected.
std::optional<TelemetryToken> ParseSpeedValue(std::string_view value);
// Whole line form: "speed=1.5x", "speed= 2.34x ", "speed=N/A".
std::optional<TelemetryToken> ParseSpeed(const std::string& line);

// Bitrate value "1234kbits/s", "1.2Mbits/s", "800bits/s" or "N/A".
// The token is captured verbatim; no unit conversion happens here.
std::optional<TelemetryToken> ParseBitrateValue(std::string_view value);
std::optional<TelemetryToken> ParseBitrate(const std::string& line);

// Parses "HH:MM:SS[.fraction]" into microseconds. The fraction is padded or
// truncated to six digits. Returns kInvalidTimestampUs on failure or "N/A".
int64_t ParseTimestampUs(std::string_view text);

// A (frame, fps, size) sample is rejected iff any member is negative.
bool ValidateSample(int64_t frame, double fps, int64_t size);

}  // namespace encodewatch::progress

#endif  // ENCODEWATCH_PROGRESS_LINE_PARSER_H_
