// Repository: encodewatch
// Component: Stream Pump
// Purpose: Reader threads feeding encoder stdout/stderr into the progress store.
// Copyright (c) 2025 encodewatch

#include "encodewatch/encode/StreamPump.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "encodewatch/progress/BatchAccumulator.h"
#include "encodewatch/progress/ProgressStore.h"
#include "encodewatch/util/Logger.h"

namespace encodewatch::encode {

namespace {
constexpr std::size_t kReadChunkBytes = 4096;

bool IsTerminator(char c) { return c == '\n' || c == '\r'; }
}  // namespace

bool LineReader::Fill() {
  if (eof_) {
    return false;
  }
  char chunk[kReadChunkBytes];
  ssize_t n;
  do {
    n = ::read(fd_, chunk, sizeof(chunk));
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    error_ = std::strerror(errno);
    eof_ = true;
    return false;
  }
  if (n == 0) {
    eof_ = true;
    return false;
  }
  buffer_.append(chunk, static_cast<std::size_t>(n));
  return true;
}

std::optional<std::string> LineReader::NextLine() {
  while (true) {
    std::size_t start = 0;
    while (start < buffer_.size() && IsTerminator(buffer_[start])) {
      ++start;
    }
    if (start > 0) {
      buffer_.erase(0, start);
    }

    for (std::size_t i = 0; i < buffer_.size(); ++i) {
      if (IsTerminator(buffer_[i])) {
        std::string line = buffer_.substr(0, i);
        buffer_.erase(0, i + 1);
        return line;
      }
    }

    if (buffer_.size() >= kMaxLineBytes) {
      std::string line = buffer_.substr(0, kMaxLineBytes);
      buffer_.erase(0, kMaxLineBytes);
      return line;
    }

    if (!Fill()) {
      if (buffer_.empty()) {
        return std::nullopt;
      }
      std::string line;
      line.swap(buffer_);
      return line;
    }
  }
}

StreamPump::StreamPump(Kind kind, UniqueFd fd, progress::ProgressStore& store)
    : kind_(kind), fd_(std::move(fd)), store_(store), lines_read_(0) {}

StreamPump::~StreamPump() { Join(); }

const char* StreamPump::name() const {
  return kind_ == Kind::kTelemetry ? "telemetry" : "diagnostics";
}

bool StreamPump::Start() {
  if (thread_) {
    return false;
  }
  thread_ = std::make_unique<std::thread>(&StreamPump::PumpLoop, this);
  return true;
}

void StreamPump::Join() {
  if (thread_ && thread_->joinable()) {
    thread_->join();
  }
}

void StreamPump::PumpLoop() {
  if (!fd_.valid()) {
    util::Logger::Warn(std::string("[StreamPump] No ") + name() + " stream to read");
    return;
  }

  LineReader reader(fd_.get());
  if (kind_ == Kind::kTelemetry) {
    PumpTelemetry(reader);
  } else {
    PumpDiagnostics(reader);
  }

  if (!reader.error().empty()) {
    const std::string message =
        std::string("Error reading ") + name() + " stream: " + reader.error();
    util::Logger::Warn("[StreamPump] " + message);
    store_.AppendLog(message);
  }
  fd_.Reset();
  util::Logger::Debug(std::string("[StreamPump] ") + name() + " stream closed after " +
                      std::to_string(lines_read()) + " lines");
}

void StreamPump::PumpTelemetry(LineReader& reader) {
  progress::BatchAccumulator accumulator;
  while (auto line = reader.NextLine()) {
    lines_read_.fetch_add(1, std::memory_order_acq_rel);
    if (auto batch = accumulator.Feed(*line)) {
      store_.ApplyBatch(*batch);
    }
  }
  if (auto partial = accumulator.Flush()) {
    store_.ApplyBatch(*partial);
  }
}

void StreamPump::PumpDiagnostics(LineReader& reader) {
  while (auto line = reader.NextLine()) {
    lines_read_.fetch_add(1, std::memory_order_acq_rel);
    store_.ApplyDiagnosticLine(*line);
  }
}

}  // namespace encodewatch::encode
