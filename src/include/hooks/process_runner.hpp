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

#pragma once

#include <chrono>
#include <string>

namespace imxup {
struct ProcessResult {
  // Exit status, or -1 when the process was killed or died on a signal
  int         exit_code_ = -1;
  bool        timed_out_ = false;
  std::string stdout_;
  std::string stderr_;
  std::chrono::milliseconds elapsed_{0};

  auto        Succeeded() const -> bool { return !timed_out_ && exit_code_ == 0; }
};

/**
 * @brief Run `command` through `/bin/sh -c` in its own process group and collect its output.
 *
 * When `timeout` elapses the whole process group is killed with SIGKILL and the result is
 * marked timed out. Throws std::runtime_error when the process cannot be started.
 */
auto RunShellCommand(const std::string& command, std::chrono::milliseconds timeout)
    -> ProcessResult;
};  // namespace imxup
