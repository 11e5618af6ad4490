#include "ecp/notify.hpp"

#include <sstream>
#include <stdexcept>

#include "ecp/observability.hpp"
#include "ecp/process.hpp"

namespace ecp {

// ---------------------------------------------------------------------------
// CommandNotifier
// ---------------------------------------------------------------------------

CommandNotifier::CommandNotifier(std::string command, std::vector<std::string> base_args,
                                 uint64_t timeout_ms)
    : command_(std::move(command)), base_args_(std::move(base_args)), timeout_ms_(timeout_ms) {}

std::string CommandNotifier::format_title(const Violation& violation) {
  return "ECP Violation: " + violation.violation_type;
}

std::string CommandNotifier::format_body(const Escalation& escalation, const Violation& violation) {
  std::ostringstream b;
  b << "## Ethics violation requiring human review\n\n"
    << "- Violation ID: " << violation.violation_id << "\n"
    << "- Type: " << violation.violation_type << "\n"
    << "- Severity: " << to_string(violation.severity) << "\n"
    << "- Agent: " << (violation.agent_id.empty() ? "unknown" : violation.agent_id) << "\n"
    << "- Function: " << (violation.function_name.empty() ? "unknown" : violation.function_name) << "\n"
    << "- Timestamp (unix ms): " << violation.timestamp_unix_ms << "\n"
    << "- Escalation ID: " << escalation.escalation_id << "\n"
    << "- Status: " << to_string(escalation.status) << "\n\n"
    << "### Message\n\n" << violation.message << "\n";
  if (!violation.context.empty()) {
    b << "\n### Context\n\n";
    for (const auto& [k, v] : violation.context) b << "- " << k << ": " << v << "\n";
  }
  return b.str();
}

NotifyResult CommandNotifier::notify(const Escalation& escalation, const Violation& violation) {
  ProcessSpec spec;
  spec.command = command_;
  spec.argv = base_args_;
  spec.argv.push_back("--title");
  spec.argv.push_back(format_title(violation));
  spec.argv.push_back("--body");
  spec.argv.push_back(format_body(escalation, violation));
  spec.timeout_ms = timeout_ms_;

  const ProcessResult r = run_process(spec);
  NotifyResult out;
  if (!r.error_message.empty()) {
    out.detail = r.error_message;
  } else if (r.timed_out) {
    out.detail = "timeout after " + std::to_string(timeout_ms_) + "ms";
  } else if (r.exit_code != 0) {
    out.detail = "exit_code=" + std::to_string(r.exit_code);
    if (!r.stderr_text.empty()) out.detail += " stderr=" + r.stderr_text.substr(0, 200);
  } else {
    out.ok = true;
    out.detail = r.stdout_text.substr(0, 200);
  }
  return out;
}

// ---------------------------------------------------------------------------
// NotificationDispatcher
// ---------------------------------------------------------------------------

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<IEscalationNotifier> notifier,
                                               std::size_t max_queue_size)
    : notifier_(notifier ? std::move(notifier) : std::make_shared<NullNotifier>()),
      max_queue_size_(max_queue_size) {
  worker_ = std::thread([this] { worker_loop(); });
}

NotificationDispatcher::~NotificationDispatcher() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable()) worker_.join();
}

void NotificationDispatcher::enqueue(Escalation escalation, Violation violation) {
  std::string dropped_id;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) return;
    if (max_queue_size_ > 0 && queue_.size() >= max_queue_size_) {
      dropped_id = queue_.front().escalation.escalation_id;
      queue_.pop_front();
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    queue_.push_back(Task{std::move(escalation), std::move(violation)});
  }
  cv_.notify_one();

  if (!dropped_id.empty()) {
    GovernanceEvent ev;
    ev.kind = GovernanceEventKind::notification_dropped;
    ev.subject_id = dropped_id;
    ev.ok = false;
    ev.error_code = to_string(ErrorCode::notify_failed);
    ev.detail = "notification queue full";
    emit_governance_event(std::move(ev));
  }
}

void NotificationDispatcher::flush() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_idle_.wait(lock, [this] { return queue_.empty() && !in_flight_; });
}

std::size_t NotificationDispatcher::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size() + (in_flight_ ? 1 : 0);
}

void NotificationDispatcher::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      // Pending notifications are still attempted on shutdown.
      if (stopping_ && queue_.empty()) {
        cv_idle_.notify_all();
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      in_flight_ = true;
    }

    NotifyResult r;
    try {
      r = notifier_->notify(task.escalation, task.violation);
    } catch (const std::exception& e) {
      r.ok = false;
      r.detail = std::string("notifier threw: ") + e.what();
    }

    GovernanceEvent ev;
    ev.subject_id = task.escalation.escalation_id;
    ev.agent_id = task.violation.agent_id;
    ev.ok = r.ok;
    ev.detail = notifier_->notifier_id() + ": " + r.detail;
    if (r.ok) {
      sent_.fetch_add(1, std::memory_order_relaxed);
      ev.kind = GovernanceEventKind::notification_sent;
    } else {
      failed_.fetch_add(1, std::memory_order_relaxed);
      ev.kind = GovernanceEventKind::notification_failed;
      ev.error_code = to_string(ErrorCode::notify_failed);
    }
    emit_governance_event(std::move(ev));

    {
      std::lock_guard<std::mutex> lock(mu_);
      in_flight_ = false;
      if (queue_.empty()) cv_idle_.notify_all();
    }
  }
}

}  // namespace ecp
