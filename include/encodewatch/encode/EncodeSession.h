// Repository: encodewatch
// Component: Encode Session
// Purpose: Owns one encode run: probe, subprocess, pump threads and the store.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_ENCODE_ENCODE_SESSION_H_
#define ENCODEWATCH_ENCODE_ENCODE_SESSION_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "encodewatch/encode/EncodeConfig.h"
#include "encodewatch/progress/ProgressStore.h"

namespace encodewatch::probe {
class MediaProbe;
}

namespace encodewatch::timing {
class MasterClock;
}

namespace encodewatch::encode {

class StreamPump;
class Subprocess;

struct SessionConfig {
  std::string ffmpeg_path;        // resolved through PATH
  progress::StoreConfig store;

  SessionConfig() : ffmpeg_path("ffmpeg") {}
};

// Outcome of the minimum source bitrate gate.
struct BitrateCheck {
  bool allowed = true;
  int64_t source_kbps = 0;        // 0 when unknown
  std::string reason;             // set when !allowed
};

// Outcome of the post-encode size check.
struct SizeCheck {
  bool ok = true;                 // false when a file size could not be read
  bool within_limit = true;
  double ratio_percent = 0.0;     // output / input x 100
  std::string error;
};

// EncodeSession drives one encode from probe to exit.
//
// Lifecycle:
// 1. Construct with the input, encoder settings and a probe (may be null if
//    the probe could not be created; ProbeSource() then fails the run).
// 2. Optionally CheckSourceBitrate(); then ProbeSource().
// 3. Start(): spawns the encoder plus three threads (stdout pump, stderr
//    pump, exit waiter).
// 4. GetState() from any thread while running.
// 5. Stop() kills the encoder; Wait() joins everything.
// The destructor stops and joins.
class EncodeSession {
 public:
  EncodeSession(std::string input_path,
                EncodeConfig encode_config,
                std::unique_ptr<probe::MediaProbe> probe,
                std::shared_ptr<timing::MasterClock> clock,
                SessionConfig config = SessionConfig());
  ~EncodeSession();

  EncodeSession(const EncodeSession&) = delete;
  EncodeSession& operator=(const EncodeSession&) = delete;

  // Compares the probed source bitrate with min_bitrate_kbps. An unknown
  // bitrate never blocks the encode.
  BitrateCheck CheckSourceBitrate();

  // Runs the frame estimate and installs it in the store. Returns false and
  // fails the run when no probe is available.
  bool ProbeSource();

  // Spawns the encoder. On spawn failure the run is marked failed and false
  // is returned. Returns false if already started or already failed.
  bool Start();

  // Kills the encoder. The exit waiter then records the run as failed.
  // Returns false when there is no running encoder to kill.
  bool Stop();

  // Blocks until the encoder has exited and both streams are drained.
  void Wait();

  [[nodiscard]] progress::SessionState GetState() const;

  // Size of the output on disk; falls back to the last telemetry size when
  // the file cannot be read.
  int64_t ActualOutputSize() const;

  // Output / input size ratio against max_size_percent (disabled when 0).
  SizeCheck CheckOutputSize() const;

  const std::string& input_path() const { return input_path_; }
  const std::string& output_path() const { return output_path_; }
  const EncodeConfig& encode_config() const { return encode_config_; }
  progress::ProgressStore& store() { return *store_; }

 private:
  void WaitLoop();

  const std::string input_path_;
  const std::string output_path_;
  const EncodeConfig encode_config_;
  const SessionConfig config_;
  std::unique_ptr<probe::MediaProbe> probe_;
  std::unique_ptr<progress::ProgressStore> store_;

  std::mutex lifecycle_mutex_;
  bool started_;
  std::unique_ptr<Subprocess> subprocess_;
  std::unique_ptr<StreamPump> telemetry_pump_;
  std::unique_ptr<StreamPump> diagnostics_pump_;
  std::unique_ptr<std::thread> waiter_thread_;

  std::mutex join_mutex_;
};

}  // namespace encodewatch::encode

#endif  // ENCODEWATCH_ENCODE_ENCODE_SESSION_H_
