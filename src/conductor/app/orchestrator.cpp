#include "conductor/app/orchestrator.hpp"

#include "conductor/pipeline/pipeline_loader.hpp"
#include "conductor/util/json.hpp"
#include "conductor/util/log.hpp"

#include <boost/asio/post.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <optional>
#include <utility>

namespace conductor {
namespace {

[[nodiscard]] auto shard_count(const SystemConfig &config) -> std::size_t {
  return config.runtime.shards > 0
             ? static_cast<std::size_t>(config.runtime.shards)
             : defaults::kShardCount;
}

[[nodiscard]] auto limiter_policy(const SystemConfig &config)
    -> RateLimitPolicy {
  return RateLimitPolicy{
      .requests_limit = config.rate_limit.default_requests_limit,
      .window = std::chrono::minutes(config.rate_limit.window_minutes)};
}

[[nodiscard]] auto pipeline_options(const SystemConfig &config)
    -> PipelineExecutorOptions {
  return PipelineExecutorOptions{
      .default_max_concurrent = config.pipeline.max_concurrent_executions,
      .default_timeout =
          std::chrono::minutes(config.pipeline.execution_timeout_minutes),
      .stats_window = std::chrono::days(config.pipeline.stats_window_days)};
}

[[nodiscard]] auto agent_options(const SystemConfig &config)
    -> AgentSchedulerOptions {
  return AgentSchedulerOptions{
      .default_timeout =
          std::chrono::minutes(config.agent.default_timeout_minutes),
      .default_max_retries = config.agent.default_max_retries,
      .stats_window = std::chrono::days(config.pipeline.stats_window_days)};
}

[[nodiscard]] auto ingestion_options(const SystemConfig &config)
    -> EventIngestionOptions {
  return EventIngestionOptions{
      .max_attempts = config.ingest.max_attempts,
      .retry_backoff = std::chrono::minutes(config.ingest.retry_backoff_minutes)};
}

} // namespace

Orchestrator::Orchestrator(boost::asio::any_io_executor executor,
                           const Clock &clock, const SystemConfig &config)
    : executor_(std::move(executor)), clock_(clock), config_(config),
      outbox_(clock, defaults::kOutboxCapacity, shard_count(config)),
      limiter_(clock, limiter_policy(config), shard_count(config)),
      hierarchy_(clock, shard_count(config)),
      dependencies_(clock, shard_count(config)),
      pipelines_(clock, pipeline_options(config), shard_count(config)),
      agents_(clock, agent_options(config), shard_count(config)),
      ingestion_(clock, limiter_, &outbox_, ingestion_options(config),
                 shard_count(config)),
      runner_(std::make_shared<PassThroughStepRunner>()) {
  wire_callbacks();
  for (const auto &source : config_.ingest.trigger_sources) {
    accept_source(source);
  }
}

Orchestrator::~Orchestrator() = default;

template <typename Fn> auto Orchestrator::post(Fn &&fn) -> void {
  boost::asio::post(executor_, std::forward<Fn>(fn));
}

auto Orchestrator::wire_callbacks() -> void {
  dependencies_.set_task_exists(
      [this](const TenantId &tenant, const TaskId &task) {
        return hierarchy_.get_task(tenant, task).has_value();
      });

  hierarchy_.set_callbacks(HierarchyCallbacks{
      .on_status_changed =
          [](const TenantId &tenant, const Task &task,
             const StatusChange &change) {
            log::debug("Task {}/{} {} -> {}", tenant, task.id,
                       to_string_view(change.from), to_string_view(change.to));
          },
      .on_task_removed =
          [this](const TenantId &tenant, const TaskId &task) {
            dependencies_.remove_task(tenant, task);
          },
      .on_corruption =
          [this](const TenantId &tenant, const TaskId &task) {
            JsonValue details = {{"task_id", task.str()},
                                 {"max_depth", static_cast<std::int64_t>(
                                                   limits::kMaxHierarchyDepth)}};
            outbox_.emit(NotificationEvent{
                .tenant = tenant,
                .integration = std::nullopt,
                .type = NotificationType::HierarchyCorruption,
                .message = std::format(
                    "parent chain of task {} exceeds the depth limit", task),
                .details = dump_json(details)});
          },
  });

  pipelines_.set_callbacks(PipelineCallbacks{
      .on_step_ready =
          [this](const StepDispatch &step) {
            post([this, step] { dispatch_step(step); });
          },
      .on_execution_finished =
          [this](const PipelineExecution &exec) {
            post([this, exec] { on_execution_finished(exec); });
          },
  });

  agents_.set_callbacks(AgentCallbacks{
      .on_task_finished =
          [this](const AgentTask &task) {
            post([this, task] { on_agent_task_finished(task); });
          },
      .on_task_requeued =
          [this](const AgentTask &task) {
            if (!agents_.has_executor()) {
              return;
            }
            post([this, tenant = task.tenant, id = task.id] {
              run_agent_task(tenant, id);
            });
          },
  });

  ingestion_.set_callbacks(IngestionCallbacks{
      .on_processed =
          [this](const WebhookEvent &event) {
            post([this, event] { on_event_processed(event); });
          },
      .on_failed = nullptr,
  });

  ingestion_.register_handler(
      std::string(kTaskSyncSource),
      [this](const WebhookEvent &event) -> Result<void> {
        return sync_task(event);
      });
}

auto Orchestrator::set_step_runner(std::shared_ptr<IStepRunner> runner)
    -> void {
  runner_ = runner ? std::move(runner)
                   : std::make_shared<PassThroughStepRunner>();
}

auto Orchestrator::set_agent_executor(std::shared_ptr<IAgentExecutor> executor)
    -> void {
  agents_.set_executor(std::move(executor));
}

auto Orchestrator::accept_source(std::string source) -> void {
  log::debug("Accepting events from '{}' as pipeline triggers", source);
  ingestion_.register_handler(
      std::move(source), [](const WebhookEvent &) -> Result<void> {
        return ok();
      });
}

auto Orchestrator::load_pipelines(const TenantId &tenant,
                                  const std::filesystem::path &directory)
    -> Result<std::size_t> {
  auto files = PipelineLoader::load_directory(directory);
  if (!files) {
    return fail(files.error());
  }

  std::size_t registered = 0;
  for (auto &file : *files) {
    auto name = file.definition.name;
    if (auto id = pipelines_.register_pipeline(tenant, std::move(file.definition));
        !id) {
      log::warn("Pipeline '{}' from {} not registered: {}", name,
                file.path.string(), id.error().message());
      continue;
    }
    ++registered;
  }
  return ok(registered);
}

auto Orchestrator::register_agent(const TenantId &tenant, AgentSpec spec)
    -> Result<AgentId> {
  if (spec.max_concurrent_tasks == 0) {
    spec.max_concurrent_tasks = config_.agent.default_max_concurrent_tasks;
  }
  return agents_.register_agent(tenant, std::move(spec));
}

auto Orchestrator::run_pipeline(const TenantId &tenant,
                                const PipelineId &pipeline,
                                TriggerRequest request) -> Result<ExecutionId> {
  auto task = request.task;
  auto id = pipelines_.trigger(tenant, pipeline, std::move(request));
  if (!id) {
    return id;
  }
  // The linked task moves first: once started, another worker may finish
  // the execution and mark the task done.
  if (task) {
    if (auto r = hierarchy_.update_status(tenant, *task, TaskStatus::InProgress,
                                          "pipeline", id->str());
        !r) {
      log::warn("Linked task {} not moved to in_progress: {}", *task,
                r.error().message());
    }
  }
  if (auto started = pipelines_.start(tenant, *id); !started) {
    log::error("Execution {} could not start: {}", *id,
               started.error().message());
    return fail(started.error());
  }
  return id;
}

auto Orchestrator::ingest(const TenantId &tenant, InboundEvent event)
    -> Result<IngestOutcome> {
  auto outcome = ingestion_.ingest(tenant, std::move(event));
  if (outcome && !outcome->duplicate) {
    post([this, tenant, id = outcome->id] { process_event(tenant, id); });
  }
  return outcome;
}

auto Orchestrator::process_event(const TenantId &tenant, const EventId &id)
    -> void {
  auto status = ingestion_.process(tenant, id);
  if (!status) {
    log::debug("Event {} not processed: {}", id, status.error().message());
  }
}

auto Orchestrator::on_event_processed(const WebhookEvent &event) -> void {
  auto matching = pipelines_.pipelines_for_event(event.tenant, event.event_type);
  if (matching.empty()) {
    return;
  }
  auto task = linked_task_for(event);
  for (const auto &def : matching) {
    auto exec = run_pipeline(event.tenant, def.id,
                             TriggerRequest{.trigger_event = event.event_type,
                                            .trigger_data = event.payload,
                                            .task = task});
    if (!exec) {
      log::warn("Event {} did not start pipeline '{}': {}", event.id, def.name,
                exec.error().message());
      continue;
    }
    log::info("Event {} ({}) started execution {} of '{}'", event.id,
              event.event_type, *exec, def.name);
  }
}

auto Orchestrator::dispatch_step(const StepDispatch &step) -> void {
  if (step.spec.type == StepType::Agent) {
    dispatch_agent_step(step);
    return;
  }

  StepOutcome outcome;
  try {
    outcome = runner_->run(step);
  } catch (const std::exception &e) {
    outcome = StepOutcome{.success = false,
                          .output = {},
                          .error = std::format("step runner threw: {}", e.what())};
  }
  report_step(step.tenant, step.execution, step.spec.name, std::move(outcome));
}

auto Orchestrator::dispatch_agent_step(const StepDispatch &step) -> void {
  JsonValue context = {{"pipeline_id", step.pipeline.str()},
                       {"execution_id", step.execution.str()},
                       {"step", step.spec.name},
                       {"attempt", static_cast<std::int64_t>(step.attempt)}};
  AgentTaskRequest request{
      .task_type = step.spec.agent_type,
      .prompt = step.spec.prompt,
      .context = dump_json(context),
      .priority = step.spec.priority,
      // Retries are owned by the step.
      .max_retries = 0,
      .required_capabilities = step.spec.capabilities,
      .task = step.task,
      .step = StepRef{.execution = step.execution, .step = step.spec.name}};

  if (!execution_open(step.tenant, step.execution)) {
    log::debug("Step '{}' of {} not dispatched: execution ended",
               step.spec.name, step.execution);
    return;
  }
  auto id = agents_.schedule(step.tenant, std::move(request));
  if (!id) {
    report_step(step.tenant, step.execution, step.spec.name,
                StepOutcome{.success = false,
                            .output = {},
                            .error = std::format("agent dispatch failed: {}",
                                                 id.error().message())});
    return;
  }

  {
    std::scoped_lock lock(agent_work_mu_);
    agent_work_[step.execution].push_back(
        AgentWork{.tenant = step.tenant, .task = *id});
  }
  // The execution may have finished between the check and the registration,
  // in which case its finish handler never saw this task.
  if (!execution_open(step.tenant, step.execution)) {
    {
      std::scoped_lock lock(agent_work_mu_);
      if (auto it = agent_work_.find(step.execution); it != agent_work_.end()) {
        std::erase_if(it->second,
                      [&](const AgentWork &w) { return w.task == *id; });
        if (it->second.empty()) {
          agent_work_.erase(it);
        }
      }
    }
    if (auto r = agents_.cancel_task(step.tenant, *id); !r) {
      log::debug("Agent task {} already finished: {}", *id,
                 r.error().message());
    }
    return;
  }
  if (agents_.has_executor()) {
    run_agent_task(step.tenant, *id);
  } else {
    log::debug("Agent task {} queued for an external worker", *id);
  }
}

auto Orchestrator::execution_open(const TenantId &tenant,
                                  const ExecutionId &id) const -> bool {
  auto exec = pipelines_.get_execution(tenant, id);
  return exec && !is_terminal(exec->status);
}

auto Orchestrator::run_agent_task(const TenantId &tenant,
                                  const AgentTaskId &id) -> void {
  if (auto status = agents_.run_task(tenant, id); !status) {
    log::warn("Agent task {} did not run: {}", id, status.error().message());
  }
}

auto Orchestrator::on_agent_task_finished(const AgentTask &task) -> void {
  if (task.status == AgentTaskStatus::Failed ||
      task.status == AgentTaskStatus::Timeout) {
    JsonValue details = {{"agent_task_id", task.id.str()},
                         {"agent_id", task.agent.str()},
                         {"task_type", task.task_type},
                         {"status", std::string(to_string_view(task.status))},
                         {"error", task.error_message}};
    outbox_.emit(NotificationEvent{
        .tenant = task.tenant,
        .integration = std::nullopt,
        .type = NotificationType::AgentTaskFailed,
        .message = std::format("agent task {} {}", task.id,
                               to_string_view(task.status)),
        .details = dump_json(details)});
  }

  if (!task.step) {
    return;
  }
  {
    std::scoped_lock lock(agent_work_mu_);
    if (auto it = agent_work_.find(task.step->execution);
        it != agent_work_.end()) {
      std::erase_if(it->second,
                    [&](const AgentWork &w) { return w.task == task.id; });
      if (it->second.empty()) {
        agent_work_.erase(it);
      }
    }
  }

  if (task.status == AgentTaskStatus::Completed) {
    report_step(task.tenant, task.step->execution, task.step->step,
                StepOutcome{.success = true, .output = task.result, .error = {}});
    return;
  }
  auto error = task.error_message.empty()
                   ? std::format("agent task {}", to_string_view(task.status))
                   : task.error_message;
  report_step(task.tenant, task.step->execution, task.step->step,
              StepOutcome{.success = false, .output = {}, .error = error});
}

auto Orchestrator::report_step(const TenantId &tenant,
                               const ExecutionId &execution,
                               const std::string &step, StepOutcome outcome)
    -> void {
  auto res = outcome.success
                 ? pipelines_.complete_step(tenant, execution, step,
                                            std::move(outcome.output))
                 : pipelines_.fail_step(tenant, execution, step,
                                        std::move(outcome.error));
  if (!res) {
    // Typically the execution already ended through cancel or timeout.
    log::debug("Result of step '{}' in {} dropped: {}", step, execution,
               res.error().message());
  }
}

auto Orchestrator::on_execution_finished(const PipelineExecution &exec)
    -> void {
  std::vector<AgentWork> orphaned;
  {
    std::scoped_lock lock(agent_work_mu_);
    if (auto it = agent_work_.find(exec.id); it != agent_work_.end()) {
      orphaned = std::move(it->second);
      agent_work_.erase(it);
    }
  }
  for (const auto &work : orphaned) {
    if (auto r = agents_.cancel_task(work.tenant, work.task); r) {
      log::debug("Agent task {} cancelled with execution {}", work.task,
                 exec.id);
    }
  }

  if (exec.task) {
    std::optional<TaskStatus> next;
    if (exec.status == ExecutionStatus::Completed) {
      next = TaskStatus::Done;
    } else if (exec.status == ExecutionStatus::Failed ||
               exec.status == ExecutionStatus::Timeout) {
      next = TaskStatus::Blocked;
    }
    if (next) {
      if (auto r = hierarchy_.update_status(exec.tenant, *exec.task, *next,
                                            "pipeline", exec.id.str());
          !r) {
        log::warn("Linked task {} not updated: {}", *exec.task,
                  r.error().message());
      }
    }
  }

  if (exec.status != ExecutionStatus::Failed &&
      exec.status != ExecutionStatus::Timeout) {
    return;
  }
  JsonValue details = {{"execution_id", exec.id.str()},
                       {"pipeline_id", exec.pipeline.str()},
                       {"status", std::string(to_string_view(exec.status))},
                       {"trigger_event", exec.trigger_event},
                       {"error", exec.error}};
  outbox_.emit(NotificationEvent{
      .tenant = exec.tenant,
      .integration = std::nullopt,
      .type = NotificationType::PipelineFailed,
      .message = std::format("execution {} {}: {}", exec.id,
                             to_string_view(exec.status), exec.error),
      .details = dump_json(details)});
}

auto Orchestrator::linked_task_for(const WebhookEvent &event) const
    -> std::optional<TaskId> {
  auto parsed = parse_json(event.payload);
  if (!parsed) {
    return std::nullopt;
  }
  auto ref = json_string(*parsed, "external_ref");
  if (!ref || ref->empty()) {
    return std::nullopt;
  }
  auto task = hierarchy_.find_by_external_ref(event.tenant, *ref);
  if (!task) {
    return std::nullopt;
  }
  return task->id;
}

auto Orchestrator::sync_task(const WebhookEvent &event) -> Result<void> {
  auto parsed = parse_json(event.payload);
  if (!parsed || !parsed->is_object()) {
    return fail(Error::ParseError);
  }
  const auto &root = *parsed;
  const auto &tenant = event.tenant;

  auto ref = json_string(root, "external_ref");
  if (!ref || ref->empty()) {
    return fail(Error::InvalidArgument);
  }
  auto title = json_string(root, "title");

  std::optional<TaskStatus> status;
  if (auto text = json_string(root, "status")) {
    status = util::try_parse_enum<TaskStatus>(*text);
    if (!status) {
      return fail(Error::InvalidArgument);
    }
  }
  std::optional<TaskPriority> priority;
  if (auto text = json_string(root, "priority")) {
    priority = util::try_parse_enum<TaskPriority>(*text);
    if (!priority) {
      return fail(Error::InvalidArgument);
    }
  }

  TaskId id;
  if (auto existing = hierarchy_.find_by_external_ref(tenant, *ref)) {
    id = existing->id;
    if (title || priority) {
      if (auto r = hierarchy_.update_details(tenant, id, title, priority); !r) {
        return r;
      }
    }
    if (status) {
      if (auto r = hierarchy_.update_status(tenant, id, *status, "task_sync",
                                            event.external_event_id);
          !r) {
        return r;
      }
    }
  } else {
    if (!title || title->empty()) {
      return fail(Error::InvalidArgument);
    }
    auto created = hierarchy_.create_task(
        tenant, NewTask{.title = std::move(*title),
                        .description = json_string(root, "description")
                                           .value_or(std::string{}),
                        .parent = std::nullopt,
                        .status = status.value_or(TaskStatus::Backlog),
                        .priority = priority.value_or(TaskPriority::Medium),
                        .external_ref = *ref});
    if (!created) {
      return fail(created.error());
    }
    id = *created;
  }

  if (auto parent_ref = json_string(root, "parent_external_ref");
      parent_ref && !parent_ref->empty()) {
    auto parent = hierarchy_.find_by_external_ref(tenant, *parent_ref);
    if (!parent) {
      // The parent may arrive in a later event; retry.
      return fail(Error::NotFound);
    }
    auto current = hierarchy_.get_task(tenant, id);
    if (!current) {
      return fail(current.error());
    }
    if (current->parent != parent->id) {
      if (auto r = hierarchy_.set_parent(tenant, id, parent->id); !r) {
        return r;
      }
    }
  }

  const auto &obj = root.get_object();
  if (auto it = obj.find("depends_on_external_refs");
      it != obj.end() && it->second.is_array()) {
    for (const auto &item : it->second.get_array()) {
      if (!item.is_string()) {
        return fail(Error::InvalidArgument);
      }
      auto dep = hierarchy_.find_by_external_ref(tenant,
                                                 item.as<std::string>());
      if (!dep) {
        return fail(Error::NotFound);
      }
      auto r = dependencies_.add_dependency(tenant, id, dep->id);
      if (!r && r.error() != make_error_code(Error::AlreadyExists)) {
        return r;
      }
    }
  }

  log::debug("Synced task {} from event {}", id, event.id);
  return ok();
}

} // namespace conductor
