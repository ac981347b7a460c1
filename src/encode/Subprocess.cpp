// Repository: encodewatch
// Component: Subprocess
// Purpose: fork/exec of the encoder with piped stdout and stderr.
// Copyright (c) 2025 encodewatch

#include "encodewatch/encode/Subprocess.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "encodewatch/util/Logger.h"

namespace encodewatch::encode {

namespace {

bool MakePipe(UniqueFd* read_end, UniqueFd* write_end, std::string* error) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    *error = std::string("pipe failed: ") + std::strerror(errno);
    return false;
  }
  read_end->Reset(fds[0]);
  write_end->Reset(fds[1]);
  return true;
}

ExitStatus DecodeWaitStatus(int status) {
  ExitStatus result;
  if (WIFEXITED(status)) {
    result.exited_normally = true;
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signal = WTERMSIG(status);
  }
  return result;
}

}  // namespace

void UniqueFd::Reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

std::string ExitStatus::Describe() const {
  if (exited_normally) {
    return "exit status " + std::to_string(exit_code);
  }
  if (signal != 0) {
    return "killed by signal " + std::to_string(signal);
  }
  return "terminated abnormally";
}

Subprocess::Subprocess(std::string program, std::vector<std::string> args)
    : program_(std::move(program)),
      args_(std::move(args)),
      pid_(-1),
      started_(false),
      reaped_(false) {}

Subprocess::~Subprocess() {
  bool needs_reap = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    needs_reap = started_ && !reaped_;
  }
  if (needs_reap) {
    Kill();
    Wait();
  }
}

std::string Subprocess::CommandLine() const {
  std::string line = program_;
  for (const auto& arg : args_) {
    line += ' ';
    line += arg;
  }
  return line;
}

SpawnResult Subprocess::Start() {
  SpawnResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
      result.error = "process already started";
      return result;
    }
  }

  UniqueFd out_read, out_write, err_read, err_write, status_read, status_write;
  if (!MakePipe(&out_read, &out_write, &result.error) ||
      !MakePipe(&err_read, &err_write, &result.error) ||
      !MakePipe(&status_read, &status_write, &result.error)) {
    return result;
  }

  std::vector<char*> argv;
  argv.reserve(args_.size() + 2);
  argv.push_back(const_cast<char*>(program_.c_str()));
  for (auto& arg : args_) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    const int dev_null = ::open("/dev/null", O_RDONLY);
    if (dev_null >= 0) {
      dup2(dev_null, STDIN_FILENO);
    }
    dup2(out_write.get(), STDOUT_FILENO);
    dup2(err_write.get(), STDERR_FILENO);
    execvp(program_.c_str(), argv.data());
    const int exec_errno = errno;
    ssize_t ignored = ::write(status_write.get(), &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
  }

  out_write.Reset();
  err_write.Reset();
  status_write.Reset();

  // The status pipe is close-on-exec: EOF means exec succeeded, an int means
  // it failed with that errno.
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_read.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.error = "failed to exec '" + program_ + "': " + std::strerror(exec_errno);
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
    started_ = true;
  }
  stdout_fd_ = std::move(out_read);
  stderr_fd_ = std::move(err_read);

  util::Logger::Debug("[Subprocess] Started pid " + std::to_string(pid) + ": " + CommandLine());
  result.ok = true;
  return result;
}

UniqueFd Subprocess::TakeStdout() { return std::move(stdout_fd_); }

UniqueFd Subprocess::TakeStderr() { return std::move(stderr_fd_); }

bool Subprocess::Kill() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!started_ || reaped_) {
    return false;
  }
  if (::kill(pid_, SIGKILL) != 0) {
    util::Logger::Warn("[Subprocess] kill(" + std::to_string(pid_) +
                       ") failed: " + std::strerror(errno));
    return false;
  }
  return true;
}

std::optional<ExitStatus> Subprocess::Wait() {
  pid_t pid;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
      return std::nullopt;
    }
    if (reaped_) {
      return exit_status_;
    }
    pid = pid_;
  }

  // Wait for exit without reaping so Kill() can still trust the pid.
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
    if (errno != EINTR) {
      util::Logger::Warn(std::string("[Subprocess] waitid failed: ") + std::strerror(errno));
      return std::nullopt;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (reaped_) {
    return exit_status_;
  }
  int status = 0;
  pid_t waited;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited < 0) {
    util::Logger::Warn(std::string("[Subprocess] waitpid failed: ") + std::strerror(errno));
    return std::nullopt;
  }
  reaped_ = true;
  exit_status_ = DecodeWaitStatus(status);
  return exit_status_;
}

}  // namespace encodewatch::encode
