#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "report_channel.hpp"
#include "report_handler.hpp"

namespace orchestrator::agent {

struct DispatcherOptions {
  // Handling attempts per report before the submitter gets util::Unavailable.
  uint32_t                  max_attempts  = 3;
  std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(20);
};

/*
  Background worker draining the report channel into the handler.

  util::Unavailable and db::TransientError put the report back on the
  channel until max_attempts; any other error fails the submitter at once.
*/
class ReportDispatcher {
 public:
  ReportDispatcher(std::shared_ptr<ReportChannel> channel, std::shared_ptr<ReportHandler> handler,
                   DispatcherOptions options = {});
  ~ReportDispatcher();

  void Start();
  // Applies what is already queued, then exits.
  void Stop();

 private:
  void Run();
  void Dispatch(PendingReport pending);

  std::shared_ptr<ReportChannel> channel_;
  std::shared_ptr<ReportHandler> handler_;
  DispatcherOptions              options_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace orchestrator::agent
