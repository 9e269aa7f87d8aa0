#pragma once

#include "conductor/agent/agent_executor.hpp"
#include "conductor/agent/agent_scheduler.hpp"
#include "conductor/config/system_config.hpp"
#include "conductor/core/clock.hpp"
#include "conductor/core/error.hpp"
#include "conductor/ingest/event_ingestion.hpp"
#include "conductor/ingest/rate_limiter.hpp"
#include "conductor/notify/notification_outbox.hpp"
#include "conductor/pipeline/pipeline_executor.hpp"
#include "conductor/pipeline/step_runner.hpp"
#include "conductor/task/dependency_graph.hpp"
#include "conductor/task/hierarchy_manager.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conductor {

// Source name of the built-in handler that mirrors external tracker items
// into the task hierarchy.
inline constexpr std::string_view kTaskSyncSource = "task_sync";

// Owns every component and wires them along the control flow: processed
// events start pipelines, pipeline steps are dispatched to agents or the
// step runner, and results flow back into executions and linked tasks.
//
// Follow-up work triggered by a callback is posted to the executor rather
// than run inline, so no component callback ever re-enters another
// component on the same stack.
class Orchestrator {
public:
  Orchestrator(boost::asio::any_io_executor executor, const Clock &clock,
               const SystemConfig &config);
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  auto operator=(const Orchestrator &) -> Orchestrator & = delete;

  auto set_step_runner(std::shared_ptr<IStepRunner> runner) -> void;
  // Without an executor, agent tasks stay queued for external workers.
  auto set_agent_executor(std::shared_ptr<IAgentExecutor> executor) -> void;
  // Registers a pass-through handler so events from `source` only start
  // pipelines.
  auto accept_source(std::string source) -> void;

  // Registers every definition found in `directory` for `tenant`.
  [[nodiscard]] auto load_pipelines(const TenantId &tenant,
                                    const std::filesystem::path &directory)
      -> Result<std::size_t>;
  // A zero max_concurrent_tasks takes the configured default.
  [[nodiscard]] auto register_agent(const TenantId &tenant, AgentSpec spec)
      -> Result<AgentId>;

  // Trigger plus start; the linked task, if any, moves to in_progress.
  [[nodiscard]] auto run_pipeline(const TenantId &tenant,
                                  const PipelineId &pipeline,
                                  TriggerRequest request)
      -> Result<ExecutionId>;
  // New events are processed asynchronously; duplicates are not.
  [[nodiscard]] auto ingest(const TenantId &tenant, InboundEvent event)
      -> Result<IngestOutcome>;

  [[nodiscard]] auto limiter() noexcept -> RateLimiter & { return limiter_; }
  [[nodiscard]] auto hierarchy() noexcept -> TaskHierarchyManager & {
    return hierarchy_;
  }
  [[nodiscard]] auto dependencies() noexcept -> DependencyGraph & {
    return dependencies_;
  }
  [[nodiscard]] auto pipelines() noexcept -> PipelineExecutor & {
    return pipelines_;
  }
  [[nodiscard]] auto agents() noexcept -> AgentScheduler & { return agents_; }
  [[nodiscard]] auto ingestion() noexcept -> EventIngestionPipeline & {
    return ingestion_;
  }
  [[nodiscard]] auto outbox() noexcept -> NotificationOutbox & {
    return outbox_;
  }
  [[nodiscard]] auto clock() const noexcept -> const Clock & { return clock_; }
  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

private:
  struct AgentWork {
    TenantId tenant;
    AgentTaskId task;
  };

  auto wire_callbacks() -> void;
  template <typename Fn> auto post(Fn &&fn) -> void;

  auto dispatch_step(const StepDispatch &step) -> void;
  auto dispatch_agent_step(const StepDispatch &step) -> void;
  auto run_agent_task(const TenantId &tenant, const AgentTaskId &id) -> void;
  [[nodiscard]] auto execution_open(const TenantId &tenant,
                                    const ExecutionId &id) const -> bool;
  auto on_agent_task_finished(const AgentTask &task) -> void;
  auto on_execution_finished(const PipelineExecution &exec) -> void;
  auto on_event_processed(const WebhookEvent &event) -> void;
  auto process_event(const TenantId &tenant, const EventId &id) -> void;
  auto report_step(const TenantId &tenant, const ExecutionId &execution,
                   const std::string &step, StepOutcome outcome) -> void;

  [[nodiscard]] auto sync_task(const WebhookEvent &event) -> Result<void>;
  [[nodiscard]] auto linked_task_for(const WebhookEvent &event) const
      -> std::optional<TaskId>;

  boost::asio::any_io_executor executor_;
  const Clock &clock_;
  SystemConfig config_;

  NotificationOutbox outbox_;
  RateLimiter limiter_;
  TaskHierarchyManager hierarchy_;
  DependencyGraph dependencies_;
  PipelineExecutor pipelines_;
  AgentScheduler agents_;
  EventIngestionPipeline ingestion_;

  std::shared_ptr<IStepRunner> runner_;

  std::mutex agent_work_mu_;
  ankerl::unordered_dense::map<ExecutionId, std::vector<AgentWork>>
      agent_work_;
};

} // namespace conductor
