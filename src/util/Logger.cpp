// Repository: encodewatch
// Component: Logger
// Purpose: Line-atomic log output for the pump threads, the session waiter and RPC handlers.
// Copyright (c) 2025 encodewatch

#include "encodewatch/util/Logger.h"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

namespace encodewatch::util {

namespace {

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

Logger::WarnSink& WarnSinkSlot() {
  static Logger::WarnSink sink;
  return sink;
}

// Read once; toggling the variable mid-run has no effect.
bool DebugRequested() {
  static const bool requested = std::getenv("ENCODEWATCH_DEBUG") != nullptr;
  return requested;
}

}  // namespace

void Logger::SetWarnSink(WarnSink sink) {
  std::lock_guard<std::mutex> lock(OutputMutex());
  WarnSinkSlot() = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugRequested()) return;

  std::lock_guard<std::mutex> lock(OutputMutex());
  if (level == LogLevel::kWarn && WarnSinkSlot()) {
    WarnSinkSlot()(line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace encodewatch::util
