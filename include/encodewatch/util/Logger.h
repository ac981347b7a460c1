// Repository: encodewatch
// Component: Logger
// Purpose: Line-atomic log output for the pump threads, the session waiter and RPC handlers.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_UTIL_LOGGER_H_
#define ENCODEWATCH_UTIL_LOGGER_H_

#include <functional>
#include <string>

namespace encodewatch::util {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

// Callers pass a whole line, "[Component] message". Each line is written and
// flushed under one lock. Debug and Info go to stdout, Warn and Error to
// stderr. Debug lines are dropped unless ENCODEWATCH_DEBUG is set.
class Logger {
 public:
  using WarnSink = std::function<void(const std::string&)>;

  static void Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Emit(LogLevel::kError, line); }

  // Receives every Warn line besides stderr. Tests use it to observe estimator
  // fallbacks. nullptr clears it.
  static void SetWarnSink(WarnSink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);
};

}  // namespace encodewatch::util

#endif  // ENCODEWATCH_UTIL_LOGGER_H_
