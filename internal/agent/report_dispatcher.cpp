#include "report_dispatcher.hpp"

#include <exception>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::agent {

using observability::IntField;
using observability::StringField;

ReportDispatcher::ReportDispatcher(std::shared_ptr<ReportChannel> channel, std::shared_ptr<ReportHandler> handler,
                                   DispatcherOptions options)
    : channel_(std::move(channel)), handler_(std::move(handler)), options_(options) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

ReportDispatcher::~ReportDispatcher() {
  Stop();
}

void ReportDispatcher::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ReportDispatcher::Run, this);
}

void ReportDispatcher::Stop() {
  channel_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void ReportDispatcher::Run() {
  for (;;) {
    auto pending = channel_->Dequeue();
    if (!pending) break;
    Dispatch(std::move(*pending));
  }
}

void ReportDispatcher::Dispatch(PendingReport pending) {
  ++pending.attempts;

  std::string transient_error;
  try {
    pending.applied.set_value(handler_->Handle(pending.report));
    return;
  } catch (const util::Unavailable& e) {
    transient_error = e.what();
  } catch (const db::TransientError& e) {
    transient_error = e.what();
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_ERROR("report handling failed", {StringField("backend_id", pending.report.backend_id),
                                                      StringField("worker_id", pending.report.worker_id),
                                                      StringField("error", e.what())});
    pending.applied.set_exception(std::current_exception());
    return;
  }

  if (pending.attempts >= options_.max_attempts) {
    ORCHESTRATOR_LOG_WARN("report not applied; worker must resend",
                          {StringField("backend_id", pending.report.backend_id),
                           StringField("worker_id", pending.report.worker_id),
                           IntField("attempts", static_cast<int64_t>(pending.attempts)),
                           StringField("error", transient_error)});
    pending.applied.set_exception(
        std::make_exception_ptr(util::Unavailable("report not applied: " + transient_error)));
    return;
  }

  ORCHESTRATOR_LOG_DEBUG("report requeued", {StringField("backend_id", pending.report.backend_id),
                                             IntField("attempt", static_cast<int64_t>(pending.attempts)),
                                             StringField("error", transient_error)});
  std::this_thread::sleep_for(options_.retry_backoff);
  channel_->Requeue(std::move(pending));
}

} // namespace orchestrator::agent
