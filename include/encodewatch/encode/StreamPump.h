// Repository: encodewatch
// Component: Stream Pump
// Purpose: Reader threads feeding encoder stdout/stderr into the progress store.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_ENCODE_STREAM_PUMP_H_
#define ENCODEWATCH_ENCODE_STREAM_PUMP_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "encodewatch/encode/Subprocess.h"

namespace encodewatch::progress {
class ProgressStore;
}

namespace encodewatch::encode {

// LineReader splits a file descriptor into lines on '\n' or '\r' (the encoder
// redraws its stats line with carriage returns). Empty lines are skipped.
// A line longer than kMaxLineBytes is delivered in pieces.
class LineReader {
 public:
  static constexpr std::size_t kMaxLineBytes = 1 << 20;

  explicit LineReader(int fd) : fd_(fd), eof_(false), error_() {}

  // Next line without its terminator; nullopt at end of stream or on a read
  // error. A trailing unterminated line is returned before end of stream.
  std::optional<std::string> NextLine();

  // Non-empty when the stream ended because read() failed.
  const std::string& error() const { return error_; }

 private:
  bool Fill();

  int fd_;
  bool eof_;
  std::string error_;
  std::string buffer_;
};

// StreamPump drains one encoder stream on its own thread until EOF.
//
// kTelemetry: `-progress` key=value lines are grouped into batches and each
//   batch is applied to the store as one unit. A trailing partial batch is
//   applied at EOF when it carries a frame, fps or size update.
// kDiagnostics: every stderr line is scanned for duration / frame-rate hints
//   and non-stats lines go to the store's bounded log.
//
// Lifecycle: construct, Start(), Join(). The destructor joins.
class StreamPump {
 public:
  enum class Kind { kTelemetry, kDiagnostics };

  StreamPump(Kind kind, UniqueFd fd, progress::ProgressStore& store);
  ~StreamPump();

  StreamPump(const StreamPump&) = delete;
  StreamPump& operator=(const StreamPump&) = delete;

  // Returns false if already started.
  bool Start();

  // Blocks until the stream reaches EOF.
  void Join();

  uint64_t lines_read() const { return lines_read_.load(std::memory_order_acquire); }

 private:
  void PumpLoop();
  void PumpTelemetry(LineReader& reader);
  void PumpDiagnostics(LineReader& reader);
  const char* name() const;

  Kind kind_;
  UniqueFd fd_;
  progress::ProgressStore& store_;
  std::atomic<uint64_t> lines_read_;
  std::unique_ptr<std::thread> thread_;
};

}  // namespace encodewatch::encode

#endif  // ENCODEWATCH_ENCODE_STREAM_PUMP_H_
