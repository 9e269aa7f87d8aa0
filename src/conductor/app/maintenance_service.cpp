#include "conductor/app/maintenance_service.hpp"

#include "conductor/app/orchestrator.hpp"
#include "conductor/util/log.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <utility>

namespace conductor {

MaintenanceService::MaintenanceService(boost::asio::any_io_executor executor,
                                       Orchestrator &orchestrator)
    : executor_(std::move(executor)), orchestrator_(orchestrator),
      config_(orchestrator.config().maintenance),
      retention_days_(orchestrator.config().ingest.retention_days) {}

MaintenanceService::~MaintenanceService() { stop(); }

auto MaintenanceService::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  schedule(std::chrono::seconds(config_.retry_sweep_interval_sec),
           [this] {
             sweep_retries();
             flush_notifications();
           });
  schedule(std::chrono::seconds(config_.timeout_check_interval_sec),
           [this] { check_timeouts(); });
  schedule(std::chrono::seconds(config_.purge_interval_sec),
           [this] { cleanup_old_data(); });
  log::info("Maintenance started (retry sweep {}s, timeouts {}s, purge {}s)",
            config_.retry_sweep_interval_sec,
            config_.timeout_check_interval_sec, config_.purge_interval_sec);
}

auto MaintenanceService::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  for (auto &timer : timers_) {
    timer->cancel();
  }
  timers_.clear();
  log::info("Maintenance stopped");
}

auto MaintenanceService::schedule(std::chrono::seconds interval, Job job)
    -> void {
  auto timer = std::make_shared<boost::asio::steady_timer>(executor_);
  timers_.push_back(timer);
  boost::asio::co_spawn(executor_,
                        run_loop(std::move(timer), interval, std::move(job)),
                        boost::asio::detached);
}

auto MaintenanceService::run_loop(
    std::shared_ptr<boost::asio::steady_timer> timer,
    std::chrono::seconds interval, Job job) -> spawn_task {
  while (running_.load(std::memory_order_acquire)) {
    timer->expires_after(interval);
    auto [ec] = co_await timer->async_wait(
        boost::asio::as_tuple(boost::asio::use_awaitable));
    if (ec || !running_.load(std::memory_order_acquire)) {
      co_return;
    }
    try {
      job();
    } catch (const std::exception &e) {
      log::error("Maintenance job failed: {}", e.what());
    }
  }
}

auto MaintenanceService::sweep_retries() -> std::size_t {
  const auto now = orchestrator_.clock().now();
  return orchestrator_.ingestion().sweep_retries(now);
}

auto MaintenanceService::check_timeouts()
    -> std::pair<std::size_t, std::size_t> {
  const auto now = orchestrator_.clock().now();
  auto executions = orchestrator_.pipelines().reap_timeouts(now);
  auto agent_tasks = orchestrator_.agents().reap_timeouts(now);
  if (executions > 0 || agent_tasks > 0) {
    log::warn("Timeout watchdog: {} execution(s), {} agent task(s) timed out",
              executions, agent_tasks);
  }
  return {executions, agent_tasks};
}

auto MaintenanceService::cleanup_old_data() -> RetentionPurge {
  const auto cutoff =
      orchestrator_.clock().now() - std::chrono::days(retention_days_);
  RetentionPurge purge{
      .events = orchestrator_.ingestion().purge_older_than(cutoff),
      .executions = orchestrator_.pipelines().purge_finished_before(cutoff),
      .agent_tasks = orchestrator_.agents().purge_finished_before(cutoff)};
  if (purge.total() > 0) {
    log::info("Retention purge: {} event(s), {} execution(s), {} agent "
              "task(s)",
              purge.events, purge.executions, purge.agent_tasks);
  }
  return purge;
}

auto MaintenanceService::flush_notifications() -> std::size_t {
  auto records = orchestrator_.outbox().drain();
  for (const auto &record : records) {
    log::info("Notification {}: {}", to_string_view(record.type),
              record.to_json());
  }
  return records.size();
}

auto MaintenanceService::run_once() -> MaintenanceReport {
  MaintenanceReport report;
  report.retried_events = sweep_retries();
  auto [executions, agent_tasks] = check_timeouts();
  report.timed_out_executions = executions;
  report.timed_out_agent_tasks = agent_tasks;
  auto purge = cleanup_old_data();
  report.purged_events = purge.events;
  report.purged_executions = purge.executions;
  report.purged_agent_tasks = purge.agent_tasks;
  report.flushed_notifications = flush_notifications();
  return report;
}

} // namespace conductor
