#pragma once

#include "conductor/config/system_config.hpp"
#include "conductor/core/coroutine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace conductor {

class Orchestrator;

struct MaintenanceReport {
  std::size_t retried_events{0};
  std::size_t timed_out_executions{0};
  std::size_t timed_out_agent_tasks{0};
  std::size_t purged_events{0};
  std::size_t purged_executions{0};
  std::size_t purged_agent_tasks{0};
  std::size_t flushed_notifications{0};
};

struct RetentionPurge {
  std::size_t events{0};
  std::size_t executions{0};
  std::size_t agent_tasks{0};

  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return events + executions + agent_tasks;
  }
};

// Periodic housekeeping: event retry sweep, pipeline and agent timeout
// watchdogs, and retention purge of terminal events, executions and agent
// tasks. Each job runs on its
// own steady_timer loop. Pending notifications are handed to the log on the
// retry sweep interval; delivery proper belongs to an external service.
class MaintenanceService {
public:
  MaintenanceService(boost::asio::any_io_executor executor,
                     Orchestrator &orchestrator);
  ~MaintenanceService();

  MaintenanceService(const MaintenanceService &) = delete;
  auto operator=(const MaintenanceService &) -> MaintenanceService & = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // One pass of each job; the timer loops call these.
  auto sweep_retries() -> std::size_t;
  auto check_timeouts() -> std::pair<std::size_t, std::size_t>;
  auto cleanup_old_data() -> RetentionPurge;
  auto flush_notifications() -> std::size_t;
  auto run_once() -> MaintenanceReport;

private:
  using Job = std::move_only_function<void()>;

  auto schedule(std::chrono::seconds interval, Job job) -> void;
  auto run_loop(std::shared_ptr<boost::asio::steady_timer> timer,
                std::chrono::seconds interval, Job job) -> spawn_task;

  boost::asio::any_io_executor executor_;
  Orchestrator &orchestrator_;
  MaintenanceConfig config_;
  int retention_days_;
  std::atomic<bool> running_{false};
  std::vector<std::shared_ptr<boost::asio::steady_timer>> timers_;
};

} // namespace conductor
