#pragma once

// ecp/notify.hpp - Escalation notification: notifier interface, the external
// command notifier and the asynchronous dispatcher.
//
// DESIGN INVARIANTS:
//   1. Notification is fire-and-forget relative to the violation record. The
//      record is durable before anything is enqueued, and a failed or dropped
//      notification never rolls it back.
//   2. The dispatcher queue is bounded. When full, the oldest pending
//      notification is dropped and counted.
//   3. Every attempt is bounded in time (CommandNotifier timeout).
//
// EXTENSION_POINT: notifier_backends
//   Current: external command (e.g. `gh issue create`) or none.
//   Upgrade path: a webhook notifier implementing IEscalationNotifier.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ecp/types.hpp"

namespace ecp {

struct NotifyResult {
  bool ok{false};
  std::string detail;
};

class IEscalationNotifier {
 public:
  virtual ~IEscalationNotifier() = default;

  // Deliver one notification. Must not throw; must return within a bounded time.
  virtual NotifyResult notify(const Escalation& escalation, const Violation& violation) = 0;

  virtual std::string notifier_id() const = 0;
};

// Accepts everything and does nothing.
class NullNotifier : public IEscalationNotifier {
 public:
  NotifyResult notify(const Escalation&, const Violation&) override { return {true, "null"}; }
  std::string notifier_id() const override { return "null"; }
};

// Runs `<command> <base_args...> --title <title> --body <body>`.
// With the defaults this files a GitHub issue through the gh CLI.
class CommandNotifier : public IEscalationNotifier {
 public:
  CommandNotifier(std::string command,
                  std::vector<std::string> base_args = {"issue", "create"},
                  uint64_t timeout_ms = 10000);

  NotifyResult notify(const Escalation& escalation, const Violation& violation) override;
  std::string notifier_id() const override { return "command:" + command_; }

  static std::string format_title(const Violation& violation);
  static std::string format_body(const Escalation& escalation, const Violation& violation);

 private:
  std::string command_;
  std::vector<std::string> base_args_;
  uint64_t timeout_ms_;
};

// ---------------------------------------------------------------------------
// NotificationDispatcher - single background worker draining a bounded queue
// ---------------------------------------------------------------------------
class NotificationDispatcher {
 public:
  explicit NotificationDispatcher(std::shared_ptr<IEscalationNotifier> notifier,
                                  std::size_t max_queue_size = 256);
  ~NotificationDispatcher();

  NotificationDispatcher(const NotificationDispatcher&) = delete;
  NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

  void enqueue(Escalation escalation, Violation violation);

  // Block until every queued notification has been attempted.
  void flush();

  uint64_t sent() const { return sent_.load(std::memory_order_relaxed); }
  uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
  std::size_t pending() const;

 private:
  struct Task {
    Escalation escalation;
    Violation violation;
  };

  void worker_loop();

  std::shared_ptr<IEscalationNotifier> notifier_;
  std::size_t max_queue_size_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_idle_;
  std::deque<Task> queue_;
  bool stopping_{false};
  bool in_flight_{false};
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> dropped_{0};
  std::thread worker_;
};

}  // namespace ecp
