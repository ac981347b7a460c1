// Repository: encodewatch
// Component: FFmpeg Media Probe
// Purpose: MediaProbe backed by libavformat, bounded by an interrupt timeout.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_PROBE_FFMPEG_MEDIA_PROBE_H_
#define ENCODEWATCH_PROBE_FFMPEG_MEDIA_PROBE_H_

#include <chrono>
#include <memory>
#include <string>

#include "encodewatch/probe/MediaProbe.h"

// Forward declaration to avoid including FFmpeg headers in public API
struct AVFormatContext;

namespace encodewatch::probe {

struct ProbeConfig {
  // Upper bound for opening the input and reading its stream info, per query.
  std::chrono::milliseconds timeout;

  ProbeConfig() : timeout(std::chrono::seconds(10)) {}
};

// FFmpegMediaProbe opens the input with libavformat for each query.
//
// Queries are independent: one failing (unreadable input, no video stream,
// timeout) does not affect the others. The interrupt callback aborts any
// blocking libavformat call once the per-query deadline passes.
class FFmpegMediaProbe : public MediaProbe {
 public:
  // Returns nullptr and fills `error` when the input cannot be probed at all.
  static std::unique_ptr<FFmpegMediaProbe> Create(const std::string& input_path,
                                                  const ProbeConfig& config,
                                                  std::string* error);

  ~FFmpegMediaProbe() override = default;

  FFmpegMediaProbe(const FFmpegMediaProbe&) = delete;
  FFmpegMediaProbe& operator=(const FFmpegMediaProbe&) = delete;

  std::optional<FrameRates> ProbeFrameRates() override;
  std::optional<int64_t> ProbeFrameCount() override;
  std::optional<double> ProbeDurationSeconds() override;
  std::optional<int64_t> ProbeBitrate() override;

  const std::string& input_path() const { return input_path_; }

 private:
  struct FormatContextDeleter {
    void operator()(AVFormatContext* ctx) const;
  };
  using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;

  struct Deadline {
    std::chrono::steady_clock::time_point at;
  };

  FFmpegMediaProbe(std::string input_path, const ProbeConfig& config);

  // Opens the input and reads stream info. `deadline` must outlive the
  // returned context. Returns nullptr on failure or timeout.
  FormatContextPtr OpenInput(Deadline& deadline, const char* query) const;

  static int InterruptCallback(void* opaque);

  std::string input_path_;
  ProbeConfig config_;
};

}  // namespace encodewatch::probe

#endif  // ENCODEWATCH_PROBE_FFMPEG_MEDIA_PROBE_H_
