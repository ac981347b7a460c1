// Repository: encodewatch
// Component: FFmpeg Media Probe
// Purpose: MediaProbe backed by libavformat, bounded by an interrupt timeout.
// Copyright (c) 2025 encodewatch

#include "encodewatch/probe/FFmpegMediaProbe.h"

#include <filesystem>
#include <system_error>
#include <utility>

#include "encodewatch/util/Logger.h"

// FFmpeg C headers
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/rational.h>
}

namespace encodewatch::probe {

namespace {

std::string AvErrorToString(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return std::string(buf);
}

double RationalToDouble(AVRational rate) {
  if (rate.num <= 0 || rate.den <= 0) {
    return 0.0;
  }
  return av_q2d(rate);
}

const AVStream* FindVideoStream(AVFormatContext* ctx) {
  const int index = av_find_best_stream(ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (index < 0) {
    return nullptr;
  }
  return ctx->streams[index];
}

}  // namespace

void FFmpegMediaProbe::FormatContextDeleter::operator()(AVFormatContext* ctx) const {
  if (ctx) {
    avformat_close_input(&ctx);
  }
}

std::unique_ptr<FFmpegMediaProbe> FFmpegMediaProbe::Create(const std::string& input_path,
                                                           const ProbeConfig& config,
                                                           std::string* error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(input_path, ec)) {
    if (error) {
      *error = "input is not a readable file: " + input_path;
    }
    return nullptr;
  }

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);
  return std::unique_ptr<FFmpegMediaProbe>(new FFmpegMediaProbe(input_path, config));
}

FFmpegMediaProbe::FFmpegMediaProbe(std::string input_path, const ProbeConfig& config)
    : input_path_(std::move(input_path)), config_(config) {}

int FFmpegMediaProbe::InterruptCallback(void* opaque) {
  const auto* deadline = static_cast<const Deadline*>(opaque);
  return std::chrono::steady_clock::now() >= deadline->at ? 1 : 0;
}

FFmpegMediaProbe::FormatContextPtr FFmpegMediaProbe::OpenInput(Deadline& deadline,
                                                               const char* query) const {
  deadline.at = std::chrono::steady_clock::now() + config_.timeout;

  AVFormatContext* raw = avformat_alloc_context();
  if (!raw) {
    util::Logger::Warn("[FFmpegMediaProbe] Failed to allocate format context");
    return nullptr;
  }
  raw->interrupt_callback.callback = &FFmpegMediaProbe::InterruptCallback;
  raw->interrupt_callback.opaque = &deadline;

  // avformat_open_input frees the context on failure.
  int ret = avformat_open_input(&raw, input_path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    util::Logger::Warn(std::string("[FFmpegMediaProbe] ") + query + ": failed to open " +
                       input_path_ + ": " + AvErrorToString(ret));
    return nullptr;
  }
  FormatContextPtr ctx(raw);

  ret = avformat_find_stream_info(ctx.get(), nullptr);
  if (ret < 0) {
    util::Logger::Warn(std::string("[FFmpegMediaProbe] ") + query +
                       ": failed to read stream info: " + AvErrorToString(ret));
    return nullptr;
  }
  return ctx;
}

std::optional<FrameRates> FFmpegMediaProbe::ProbeFrameRates() {
  Deadline deadline;
  FormatContextPtr ctx = OpenInput(deadline, "frame rate");
  if (!ctx) {
    return std::nullopt;
  }
  const AVStream* stream = FindVideoStream(ctx.get());
  if (!stream) {
    util::Logger::Warn("[FFmpegMediaProbe] No video stream in " + input_path_);
    return std::nullopt;
  }

  FrameRates rates;
  rates.real_fps = RationalToDouble(stream->r_frame_rate);
  rates.average_fps = RationalToDouble(stream->avg_frame_rate);
  return rates;
}

std::optional<int64_t> FFmpegMediaProbe::ProbeFrameCount() {
  Deadline deadline;
  FormatContextPtr ctx = OpenInput(deadline, "frame count");
  if (!ctx) {
    return std::nullopt;
  }
  const AVStream* stream = FindVideoStream(ctx.get());
  if (!stream || stream->nb_frames <= 0) {
    return std::nullopt;
  }
  return static_cast<int64_t>(stream->nb_frames);
}

std::optional<double> FFmpegMediaProbe::ProbeDurationSeconds() {
  Deadline deadline;
  FormatContextPtr ctx = OpenInput(deadline, "duration");
  if (!ctx) {
    return std::nullopt;
  }
  if (ctx->duration == AV_NOPTS_VALUE || ctx->duration <= 0) {
    return std::nullopt;
  }
  return static_cast<double>(ctx->duration) / static_cast<double>(AV_TIME_BASE);
}

std::optional<int64_t> FFmpegMediaProbe::ProbeBitrate() {
  Deadline deadline;
  FormatContextPtr ctx = OpenInput(deadline, "bitrate");
  if (!ctx) {
    return std::nullopt;
  }
  if (ctx->bit_rate > 0) {
    return static_cast<int64_t>(ctx->bit_rate);
  }
  const AVStream* stream = FindVideoStream(ctx.get());
  if (stream && stream->codecpar && stream->codecpar->bit_rate > 0) {
    return static_cast<int64_t>(stream->codecpar->bit_rate);
  }
  return std::nullopt;
}

}  // namespace encodewatch::probe
