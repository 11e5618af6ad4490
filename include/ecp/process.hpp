#pragma once

// ecp/process.hpp - Bounded child-process runner used by CommandNotifier.
//
// The runner forks, execs the command (resolved through PATH) in its own
// process group, captures stdout/stderr up to max_output_bytes and kills the
// whole group once timeout_ms elapses. It never throws; spawn failures are
// reported in ProcessResult::error_message.
//
// PLATFORM GUARDS:
//   POSIX only (process_posix.cpp).

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ecp {

struct ProcessSpec {
  std::string command;            // executable name or path
  std::vector<std::string> argv;  // arguments after the command itself
  uint64_t timeout_ms{10000};
  std::size_t max_output_bytes{64 * 1024};
};

struct ProcessResult {
  int exit_code{-1};  // 124 on timeout, 128+N when killed by signal N
  bool timed_out{false};
  std::string stdout_text;
  std::string stderr_text;
  bool output_truncated{false};
  std::string error_message;  // "", "pipe_failed", "fork_failed"

  bool ok() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

ProcessResult run_process(const ProcessSpec& spec);

}  // namespace ecp
