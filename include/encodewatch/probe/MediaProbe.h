// Repository: encodewatch
// Component: Media Probe
// Purpose: Metadata queries issued against the input before streaming begins.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROBE_MEDIA_PROBE_H_
#define ENCODEWATCH_PROBE_MEDIA_PROBE_H_

#include <cstdint>
#include <optional>

namespace encodewatch::probe {

// FrameRates holds the first video stream's real and average frame rates.
// Either may be 0 when the container does not declare it.
struct FrameRates {
  double real_fps = 0.0;
  double average_fps = 0.0;
};

// MediaProbe answers independent metadata queries about one input.
//
// Every query returns std::nullopt when the answer is unavailable, including
// timeouts and unreadable inputs. A failed query is never fatal; callers move
// on to their next fallback.
class MediaProbe {
 public:
  virtual ~MediaProbe() = default;

  virtual std::optional<FrameRates> ProbeFrameRates() = 0;

  // Container-declared frame count of the first video stream.
  virtual std::optional<int64_t> ProbeFrameCount() = 0;

  // Container duration in seconds.
  virtual std::optional<double> ProbeDurationSeconds() = 0;

  // Source bitrate in bits per second (container, then video stream).
  virtual std::optional<int64_t> ProbeBitrate() = 0;
};

}  // namespace encodewatch::probe

#endif  // ENCODEWATCH_PROBE_MEDIA_PROBE_H_
