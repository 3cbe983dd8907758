#include "report_channel.hpp"

namespace orchestrator::agent {

std::optional<std::future<store::ApplyOutcome>> ReportChannel::Submit(WorkerReport report) {
  PendingReport pending;
  pending.report = std::move(report);
  auto applied   = pending.applied.get_future();
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return std::nullopt;
    queue_.push(std::move(pending));
  }
  cv_.notify_one();
  return applied;
}

void ReportChannel::Requeue(PendingReport pending) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(pending));
  }
  cv_.notify_one();
}

std::optional<PendingReport> ReportChannel::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  PendingReport pending = std::move(queue_.front());
  queue_.pop();
  return pending;
}

void ReportChannel::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t ReportChannel::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace orchestrator::agent
