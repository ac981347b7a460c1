// Repository: encodewatch
// Component: Encode Session
// Purpose: Owns one encode run: probe, subprocess, pump threads and the store.
// Copyright (c) 2025 encodewatch

#include "encodewatch/encode/EncodeSession.h"

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include "encodewatch/encode/StreamPump.h"
#include "encodewatch/encode/Subprocess.h"
#include "encodewatch/probe/MediaProbe.h"
#include "encodewatch/progress/FrameEstimator.h"
#include "encodewatch/timing/MasterClock.h"
#include "encodewatch/util/Logger.h"

namespace encodewatch::encode {

namespace {

std::optional<int64_t> FileSize(const std::string& path, std::string* error) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    if (error) {
      *error = path + ": " + ec.message();
    }
    return std::nullopt;
  }
  return static_cast<int64_t>(size);
}

}  // namespace

EncodeSession::EncodeSession(std::string input_path,
                             EncodeConfig encode_config,
                             std::unique_ptr<probe::MediaProbe> probe,
                             std::shared_ptr<timing::MasterClock> clock,
                             SessionConfig config)
    : input_path_(std::move(input_path)),
      output_path_(OutputPathFor(input_path_)),
      encode_config_(std::move(encode_config)),
      config_(std::move(config)),
      probe_(std::move(probe)),
      store_(std::make_unique<progress::ProgressStore>(std::move(clock), config_.store)),
      started_(false) {}

EncodeSession::~EncodeSession() {
  Stop();
  Wait();
}

BitrateCheck EncodeSession::CheckSourceBitrate() {
  BitrateCheck check;
  if (encode_config_.min_bitrate_kbps <= 0) {
    return check;
  }
  if (!probe_) {
    util::Logger::Warn("[EncodeSession] No probe, skipping minimum bitrate check");
    return check;
  }

  const auto bits_per_second = probe_->ProbeBitrate();
  if (!bits_per_second || *bits_per_second <= 0) {
    util::Logger::Warn("[EncodeSession] Source bitrate unknown, skipping minimum bitrate check");
    return check;
  }

  check.source_kbps = *bits_per_second / 1000;
  if (check.source_kbps < encode_config_.min_bitrate_kbps) {
    check.allowed = false;
    check.reason = "Source bitrate " + std::to_string(check.source_kbps) +
                   " kbps is below the minimum of " +
                   std::to_string(encode_config_.min_bitrate_kbps) + " kbps";
    store_->AppendLog("Skipping encode: " + check.reason);
    util::Logger::Info("[EncodeSession] " + check.reason);
  }
  return check;
}

bool EncodeSession::ProbeSource() {
  if (!probe_) {
    store_->FailRun("media probe unavailable for " + input_path_);
    return false;
  }

  const progress::FrameEstimator estimator(config_.store.frames);
  const progress::FrameEstimate estimate = estimator.Estimate(*probe_);
  store_->ApplyEstimate(estimate);
  return true;
}

bool EncodeSession::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_) {
    util::Logger::Warn("[EncodeSession] Start called twice for " + input_path_);
    return false;
  }
  if (store_->Snapshot().failed()) {
    return false;
  }
  started_ = true;

  subprocess_ = std::make_unique<Subprocess>(
      config_.ffmpeg_path, encode_config_.BuildFFmpegArgs(input_path_, output_path_));

  store_->AppendLog("Starting encode: " + input_path_);
  store_->AppendLog("Output: " + output_path_);
  store_->AppendLog("Command: " + subprocess_->CommandLine());
  store_->BeginRun();

  const SpawnResult spawn = subprocess_->Start();
  if (!spawn.ok) {
    store_->FailRun("failed to start encoder: " + spawn.error);
    return false;
  }

  telemetry_pump_ = std::make_unique<StreamPump>(StreamPump::Kind::kTelemetry,
                                                 subprocess_->TakeStdout(), *store_);
  diagnostics_pump_ = std::make_unique<StreamPump>(StreamPump::Kind::kDiagnostics,
                                                   subprocess_->TakeStderr(), *store_);
  telemetry_pump_->Start();
  diagnostics_pump_->Start();
  waiter_thread_ = std::make_unique<std::thread>(&EncodeSession::WaitLoop, this);

  util::Logger::Info("[EncodeSession] Encoding " + input_path_ + " -> " + output_path_ +
                     " (pid " + std::to_string(subprocess_->pid()) + ")");
  return true;
}

void EncodeSession::WaitLoop() {
  const std::optional<ExitStatus> status = subprocess_->Wait();

  // Drain both streams before recording the outcome so the final batch is
  // applied ahead of finalization.
  telemetry_pump_->Join();
  diagnostics_pump_->Join();

  if (!status) {
    store_->FailRun("lost track of encoder process");
  } else if (status->ok()) {
    store_->CompleteRun();
    util::Logger::Info("[EncodeSession] Encoding finished: " + output_path_);
  } else {
    store_->FailRun("encoder " + status->Describe());
  }
}

bool EncodeSession::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!subprocess_ || !subprocess_->Kill()) {
    return false;
  }
  util::Logger::Info("[EncodeSession] Stop requested, encoder killed");
  return true;
}

void EncodeSession::Wait() {
  std::thread* waiter = nullptr;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    waiter = waiter_thread_.get();
  }
  if (!waiter) {
    return;
  }
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (waiter->joinable()) {
    waiter->join();
  }
}

progress::SessionState EncodeSession::GetState() const { return store_->Snapshot(); }

int64_t EncodeSession::ActualOutputSize() const {
  std::string error;
  if (const auto size = FileSize(output_path_, &error)) {
    return *size;
  }
  util::Logger::Debug("[EncodeSession] Output size unavailable (" + error +
                      "), using telemetry size");
  return store_->Progress().total_output_bytes;
}

SizeCheck EncodeSession::CheckOutputSize() const {
  SizeCheck check;
  if (encode_config_.max_size_percent == 0) {
    return check;
  }

  const auto input_size = FileSize(input_path_, &check.error);
  if (!input_size) {
    check.ok = false;
    return check;
  }
  const auto output_size = FileSize(output_path_, &check.error);
  if (!output_size) {
    check.ok = false;
    return check;
  }
  if (*input_size <= 0) {
    check.ok = false;
    check.error = input_path_ + ": empty input";
    return check;
  }

  check.ratio_percent =
      static_cast<double>(*output_size) / static_cast<double>(*input_size) * 100.0;
  check.within_limit = check.ratio_percent <= encode_config_.max_size_percent;
  return check;
}

}  // namespace encodewatch::encode
