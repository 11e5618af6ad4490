#include "ecp/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>

namespace ecp {

namespace {

constexpr int kExecFailedExit = 127;
constexpr int kTimeoutExit = 124;

// Read end and write end of one pipe; both closed on destruction.
struct Pipe {
  int fd[2]{-1, -1};

  bool open() { return ::pipe(fd) == 0; }
  void close_read() { close_fd(fd[0]); }
  void close_write() { close_fd(fd[1]); }
  ~Pipe() {
    close_read();
    close_write();
  }

 private:
  static void close_fd(int& f) {
    if (f >= 0) ::close(f);
    f = -1;
  }
};

struct Capture {
  std::string* text;
  std::size_t limit;
  bool* truncated;
};

// Returns false once the pipe reports EOF or an unrecoverable error.
bool drain(int fd, Capture out) {
  char buf[512];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      const std::size_t room = out.text->size() < out.limit ? out.limit - out.text->size() : 0;
      const std::size_t take = std::min(room, static_cast<std::size_t>(n));
      out.text->append(buf, take);
      if (take < static_cast<std::size_t>(n)) *out.truncated = true;
      continue;
    }
    if (n == 0) return false;
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  Pipe out;
  Pipe err;
  if (!out.open() || !err.open()) {
    result.error_message = "pipe_failed";
    return result;
  }

  // argv is assembled before fork(); the child only calls async-signal-safe functions.
  std::vector<std::string> args;
  args.reserve(spec.argv.size() + 1);
  args.push_back(spec.command);
  args.insert(args.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> child_argv;
  child_argv.reserve(args.size() + 1);
  for (auto& a : args) child_argv.push_back(a.data());
  child_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.error_message = "fork_failed";
    return result;
  }
  if (pid == 0) {
    ::setsid();
    ::dup2(out.fd[1], STDOUT_FILENO);
    ::dup2(err.fd[1], STDERR_FILENO);
    out.close_read();
    err.close_read();
    out.close_write();
    err.close_write();
    ::execvp(spec.command.c_str(), child_argv.data());
    ::_exit(kExecFailedExit);
  }

  out.close_write();
  err.close_write();
  ::fcntl(out.fd[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err.fd[0], F_SETFL, O_NONBLOCK);

  const Capture out_cap{&result.stdout_text, spec.max_output_bytes, &result.output_truncated};
  const Capture err_cap{&result.stderr_text, spec.max_output_bytes, &result.output_truncated};
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);

  bool out_open = true;
  bool err_open = true;
  int status = 0;
  bool reaped = false;
  while (!reaped) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

    pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {out.fd[0], POLLIN, 0};
    if (err_open) fds[nfds++] = {err.fd[0], POLLIN, 0};
    // With both pipes closed, poll() only paces the waitpid() checks.
    ::poll(nfds ? fds : nullptr, nfds, static_cast<int>(std::min<long long>(remaining, 20)));

    if (out_open) out_open = drain(out.fd[0], out_cap);
    if (err_open) err_open = drain(err.fd[0], err_cap);
    reaped = ::waitpid(pid, &status, WNOHANG) == pid;
  }

  // Collect whatever the child wrote before it exited.
  if (out_open) drain(out.fd[0], out_cap);
  if (err_open) drain(err.fd[0], err_cap);

  result.exit_code = result.timed_out ? kTimeoutExit : decode_status(status);
  return result;
}

}  // namespace ecp
