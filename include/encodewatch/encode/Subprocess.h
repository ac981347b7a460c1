// Repository: encodewatch
// Component: Subprocess
// Purpose: fork/exec of the encoder with piped stdout and stderr.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_ENCODE_SUBPROCESS_H_
#define ENCODEWATCH_ENCODE_SUBPROCESS_H_

#include <sys/types.h>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace encodewatch::encode {

// UniqueFd owns a file descriptor and closes it on destruction.
class UniqueFd {
 public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { Reset(); }

  UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  int Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset(int fd = -1);

 private:
  int fd_;
};

// ExitStatus describes how the child terminated.
struct ExitStatus {
  bool exited_normally = false;  // WIFEXITED
  int exit_code = -1;
  int signal = 0;                // set when killed by a signal

  bool ok() const { return exited_normally && exit_code == 0; }

  // "exit status 1", "killed by signal 9".
  std::string Describe() const;
};

struct SpawnResult {
  bool ok = false;
  std::string error;
};

// Subprocess runs one program with stdout and stderr connected to pipes.
// stdin is /dev/null.
//
// Thread model: Wait() is called by one waiter thread; Kill() may be called
// from any thread, before, during or after Wait(). Kill() never signals a
// pid that has already been reaped.
class Subprocess {
 public:
  // `program` is resolved through PATH; `args` excludes argv[0].
  Subprocess(std::string program, std::vector<std::string> args);

  // Kills and reaps a child that is still running.
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  // Forks and execs. Reports fork, pipe and exec failures (such as a missing
  // binary) synchronously. May only be called once.
  SpawnResult Start();

  // Read ends of the child's stdout / stderr. Valid once after Start().
  UniqueFd TakeStdout();
  UniqueFd TakeStderr();

  // Sends SIGKILL. Returns false if the child was never started or has
  // already been reaped.
  bool Kill();

  // Blocks until the child exits and reaps it. nullopt if not started or if
  // waiting failed.
  std::optional<ExitStatus> Wait();

  pid_t pid() const { return pid_; }

  // "ffmpeg -hide_banner ..." for logging.
  std::string CommandLine() const;

 private:
  std::string program_;
  std::vector<std::string> args_;

  pid_t pid_;
  UniqueFd stdout_fd_;
  UniqueFd stderr_fd_;

  std::mutex mutex_;
  bool started_;
  bool reaped_;
  std::optional<ExitStatus> exit_status_;
};

}  // namespace encodewatch::encode

#endif  // ENCODEWATCH_ENCODE_SUBPROCESS_H_
