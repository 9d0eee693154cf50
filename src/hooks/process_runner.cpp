//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "hooks/process_runner.hpp"

#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>
#include <thread>

namespace imxup {
namespace {
constexpr size_t kMaxCapture = 1 << 20;

class Pipe {
 public:
  Pipe() {
    if (pipe2(fds_, O_CLOEXEC) != 0) {
      throw std::runtime_error(std::format("pipe failed: {}", std::strerror(errno)));
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  auto Read() const -> int { return fds_[0]; }
  auto Write() const -> int { return fds_[1]; }
  void CloseRead() {
    if (fds_[0] >= 0) close(fds_[0]);
    fds_[0] = -1;
  }
  void CloseWrite() {
    if (fds_[1] >= 0) close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2] = {-1, -1};
};

/**
 * @brief Append what is readable on `fd`. Returns false once the writer side is closed.
 */
auto Drain(int fd, std::string& sink) -> bool {
  char buf[4096];
  auto n = read(fd, buf, sizeof(buf));
  if (n > 0) {
    if (sink.size() < kMaxCapture) {
      sink.append(buf, static_cast<size_t>(n));
    }
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
  return false;
}
}  // namespace

auto RunShellCommand(const std::string& command, std::chrono::milliseconds timeout)
    -> ProcessResult {
  Pipe out;
  Pipe err;
  auto start = std::chrono::steady_clock::now();

  pid_t pid  = fork();
  if (pid < 0) {
    throw std::runtime_error(std::format("fork failed: {}", std::strerror(errno)));
  }
  if (pid == 0) {
    // Child: own process group so a timeout can take down everything the shell spawned
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(out.Write(), STDOUT_FILENO);
    dup2(err.Write(), STDERR_FILENO);
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }
  // Both sides call setpgid so the group exists before we might signal it
  setpgid(pid, pid);
  out.CloseWrite();
  err.CloseWrite();

  ProcessResult result;
  auto          deadline = start + timeout;
  bool          out_open = true;
  bool          err_open = true;
  while (out_open || err_open) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out_ = true;
      break;
    }
    pollfd fds[2];
    nfds_t count = 0;
    if (out_open) fds[count++] = pollfd{out.Read(), POLLIN, 0};
    if (err_open) fds[count++] = pollfd{err.Read(), POLLIN, 0};
    int ready = poll(fds, count, static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
    if (ready < 0) {
      if (errno == EINTR) continue;
      LOG(ERROR) << "[hooks] poll failed: " << std::strerror(errno);
      result.timed_out_ = true;
      break;
    }
    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
      bool is_out = fds[i].fd == out.Read();
      bool open   = Drain(fds[i].fd, is_out ? result.stdout_ : result.stderr_);
      if (!open) (is_out ? out_open : err_open) = false;
    }
  }

  // The pipes may close long before the child exits (a hook that redirects its own output),
  // so reaping is bounded by the same deadline
  int status = 0;
  bool reaped = false;
  while (!result.timed_out_) {
    auto done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      reaped = true;
      break;
    }
    if (done < 0 && errno != EINTR) {
      LOG(ERROR) << "[hooks] waitpid failed: " << std::strerror(errno);
      status = -1;
      reaped = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      result.timed_out_ = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
  }

  if (!reaped) {
    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) {
        LOG(ERROR) << "[hooks] waitpid failed: " << std::strerror(errno);
        status = -1;
        break;
      }
    }
  }
  if (!result.timed_out_ && status != -1 && WIFEXITED(status)) {
    result.exit_code_ = WEXITSTATUS(status);
  }
  result.elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  return result;
}
};  // namespace imxup
