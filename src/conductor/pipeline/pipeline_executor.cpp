#include "conductor/pipeline/pipeline_executor.hpp"

#include "conductor/util/log.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace conductor {

PipelineExecutor::PipelineExecutor(const Clock &clock,
                                   PipelineExecutorOptions options,
                                   std::size_t shards)
    : clock_(clock), options_(options), pipelines_(shards), names_(shards),
      executions_(shards), stats_(shards) {}

auto PipelineExecutor::set_callbacks(PipelineCallbacks callbacks) -> void {
  callbacks_ = std::move(callbacks);
}

auto PipelineExecutor::prepare(const TenantId &tenant, PipelineDefinition &def,
                               std::shared_ptr<const StepGraph> &graph) const
    -> Result<void> {
  if (!is_valid_id_text(tenant.value()) || !is_valid_id_text(def.name)) {
    return fail(Error::InvalidArgument);
  }
  if (def.steps.empty() || def.max_concurrent_executions < 0 ||
      def.timeout.count() < 0) {
    return fail(Error::InvalidArgument);
  }
  if (def.max_concurrent_executions == 0) {
    def.max_concurrent_executions = options_.default_max_concurrent;
  }
  if (def.timeout.count() == 0) {
    def.timeout = options_.default_timeout;
  }

  std::string diagnostic;
  auto built = StepGraph::build(def.steps, &diagnostic);
  if (!built) {
    log::warn("Pipeline '{}' rejected: {}", def.name, diagnostic);
    return fail(built.error());
  }
  graph = std::make_shared<const StepGraph>(std::move(*built));
  return ok();
}

auto PipelineExecutor::register_pipeline(const TenantId &tenant,
                                         PipelineDefinition def)
    -> Result<PipelineId> {
  std::shared_ptr<const StepGraph> graph;
  if (auto r = prepare(tenant, def, graph); !r) {
    return fail(r.error());
  }

  const auto now = clock_.now();
  def.id = generate_id<PipelineId>("pl");
  def.tenant = tenant;
  def.version = 1;
  def.created_at = now;
  def.updated_at = now;
  auto id = def.id;

  NameKey key{.tenant = tenant, .name = def.name};
  auto res = names_.with_shard(key, [&](auto &names) -> Result<void> {
    if (names.contains(key)) {
      return fail(Error::AlreadyExists);
    }
    names.emplace(key, id);
    pipelines_.with_shard(id, [&](auto &slots) {
      slots.emplace(id, Slot{.def = std::make_shared<const PipelineDefinition>(
                                 std::move(def)),
                             .graph = std::move(graph),
                             .active = {}});
    });
    return ok();
  });
  if (!res) {
    log::warn("Pipeline '{}' already exists in tenant {}", key.name, tenant);
    return fail(res.error());
  }

  log::info("Registered pipeline {} ({}) for tenant {}", key.name, id, tenant);
  return ok(std::move(id));
}

auto PipelineExecutor::update_pipeline(const TenantId &tenant,
                                       PipelineDefinition def) -> Result<int> {
  std::shared_ptr<const StepGraph> graph;
  if (auto r = prepare(tenant, def, graph); !r) {
    return fail(r.error());
  }

  const auto now = clock_.now();
  auto id = def.id;
  return pipelines_.with_shard(id, [&](auto &slots) -> Result<int> {
    auto it = slots.find(id);
    if (it == slots.end() || it->second.def->tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &slot = it->second;
    if (slot.def->name != def.name) {
      return fail(Error::InvalidArgument);
    }
    def.tenant = tenant;
    def.created_at = slot.def->created_at;
    def.updated_at = now;
    def.version = slot.def->version + 1;
    const int version = def.version;
    slot.def = std::make_shared<const PipelineDefinition>(std::move(def));
    slot.graph = std::move(graph);
    log::info("Pipeline {} updated to version {}", id, version);
    return ok(version);
  });
}

auto PipelineExecutor::get_pipeline(const TenantId &tenant,
                                    const PipelineId &id) const
    -> Result<PipelineDefinition> {
  auto slot = pipelines_.find_copy(id);
  if (!slot || slot->def->tenant != tenant) {
    return fail(Error::NotFound);
  }
  return ok(*slot->def);
}

auto PipelineExecutor::find_pipeline(const TenantId &tenant,
                                     std::string_view name) const
    -> Result<PipelineDefinition> {
  auto id = names_.find_copy(NameKey{.tenant = tenant, .name = std::string(name)});
  if (!id) {
    return fail(Error::NotFound);
  }
  return get_pipeline(tenant, *id);
}

auto PipelineExecutor::pipelines(const TenantId &tenant) const
    -> std::vector<PipelineDefinition> {
  std::vector<PipelineDefinition> out;
  pipelines_.for_each_shard([&](const auto &slots) {
    for (const auto &[id, slot] : slots) {
      if (slot.def->tenant == tenant) {
        out.push_back(*slot.def);
      }
    }
  });
  std::ranges::sort(out, {}, &PipelineDefinition::name);
  return out;
}

auto PipelineExecutor::pipelines_for_event(const TenantId &tenant,
                                           std::string_view event_type) const
    -> std::vector<PipelineDefinition> {
  std::vector<PipelineDefinition> out;
  pipelines_.for_each_shard([&](const auto &slots) {
    for (const auto &[id, slot] : slots) {
      const auto &def = *slot.def;
      if (def.tenant == tenant && def.active &&
          std::ranges::find(def.trigger_events, event_type) !=
              def.trigger_events.end()) {
        out.push_back(def);
      }
    }
  });
  std::ranges::sort(out, {}, &PipelineDefinition::name);
  return out;
}

auto PipelineExecutor::set_active(const TenantId &tenant, const PipelineId &id,
                                  bool active) -> Result<void> {
  const auto now = clock_.now();
  return pipelines_.with_shard(id, [&](auto &slots) -> Result<void> {
    auto it = slots.find(id);
    if (it == slots.end() || it->second.def->tenant != tenant) {
      return fail(Error::NotFound);
    }
    if (it->second.def->active == active) {
      return ok();
    }
    auto copy = *it->second.def;
    copy.active = active;
    copy.updated_at = now;
    it->second.def = std::make_shared<const PipelineDefinition>(std::move(copy));
    log::info("Pipeline {} {}", id, active ? "activated" : "deactivated");
    return ok();
  });
}

auto PipelineExecutor::stats(const TenantId &tenant, const PipelineId &id) const
    -> Result<PipelineStats> {
  if (!get_pipeline(tenant, id)) {
    return fail(Error::NotFound);
  }
  auto state = stats_.find_copy(id);
  if (!state) {
    return ok(PipelineStats{});
  }
  return ok(std::move(state->summary));
}

auto PipelineExecutor::trigger(const TenantId &tenant,
                               const PipelineId &pipeline,
                               TriggerRequest request) -> Result<ExecutionId> {
  const auto now = clock_.now();
  auto exec_id = generate_id<ExecutionId>("exec");

  // Admission and insert happen under the pipeline lock so concurrent
  // triggers cannot overshoot the limit.
  auto res = pipelines_.with_shard(pipeline, [&](auto &slots) -> Result<void> {
    auto it = slots.find(pipeline);
    if (it == slots.end() || it->second.def->tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &slot = it->second;
    if (!slot.def->active) {
      return fail(Error::InvalidState);
    }
    if (std::cmp_greater_equal(slot.active.size(),
                               slot.def->max_concurrent_executions)) {
      return fail(Error::CapacityExceeded);
    }

    Record rec{.meta = PipelineExecution{.id = exec_id,
                                         .pipeline = pipeline,
                                         .tenant = tenant,
                                         .task = std::move(request.task),
                                         .trigger_event =
                                             std::move(request.trigger_event),
                                         .trigger_data =
                                             std::move(request.trigger_data),
                                         .status = ExecutionStatus::Queued,
                                         .created_at = now,
                                         .started_at = std::nullopt,
                                         .completed_at = std::nullopt,
                                         .duration = std::nullopt,
                                         .error = {},
                                         .steps = {}},
               .def = slot.def,
               .run = PipelineRun(slot.graph)};
    executions_.with_shard(exec_id, [&](auto &execs) {
      execs.emplace(exec_id, std::move(rec));
    });
    slot.active.insert(exec_id);
    return ok();
  });

  if (!res) {
    log::warn("Trigger of pipeline {} rejected: {}", pipeline,
              res.error().message());
    return fail(res.error());
  }

  stats_.with_shard(pipeline, [&](auto &states) {
    auto &summary = states[pipeline].summary;
    ++summary.execution_count;
    summary.last_executed_at = now;
  });

  log::debug("Execution {} of pipeline {} queued", exec_id, pipeline);
  return ok(std::move(exec_id));
}

auto PipelineExecutor::snapshot(const Record &rec) -> PipelineExecution {
  PipelineExecution out = rec.meta;
  const auto &infos = rec.run.steps();
  out.steps.reserve(infos.size());
  for (std::size_t i = 0; i < infos.size(); ++i) {
    const auto &info = infos[i];
    const auto &tmpl = rec.def->steps[i];
    out.steps.push_back(PipelineStep{.id = info.id,
                                     .name = tmpl.name,
                                     .order = static_cast<int>(i),
                                     .type = tmpl.type,
                                     .depends_on = tmpl.depends_on,
                                     .status = info.status,
                                     .retry_count = info.retry_count,
                                     .max_retries = info.max_retries,
                                     .started_at = info.started_at,
                                     .completed_at = info.completed_at,
                                     .output = info.output,
                                     .error = info.error});
  }
  return out;
}

auto PipelineExecutor::dispatches_for(const Record &rec,
                                      std::span<const NodeIndex> started)
    -> std::vector<StepDispatch> {
  std::vector<StepDispatch> out;
  out.reserve(started.size());
  for (NodeIndex idx : started) {
    const auto &info = rec.run.info(idx);
    out.push_back(StepDispatch{.tenant = rec.meta.tenant,
                               .pipeline = rec.meta.pipeline,
                               .execution = rec.meta.id,
                               .step = info.id,
                               .spec = rec.def->steps[idx],
                               .attempt = info.retry_count + 1,
                               .task = rec.meta.task});
  }
  return out;
}

auto PipelineExecutor::finalize(Record &rec, ExecutionStatus status,
                                std::string error, TimePoint now) -> void {
  auto &meta = rec.meta;
  meta.status = status;
  meta.error = std::move(error);
  if (!meta.completed_at) {
    meta.completed_at = now;
    if (meta.started_at) {
      meta.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          now - *meta.started_at);
    }
  }
}

auto PipelineExecutor::start(const TenantId &tenant, const ExecutionId &id)
    -> Result<std::vector<StepDispatch>> {
  const auto now = clock_.now();
  Transition transition;

  auto res = executions_.with_shard(id, [&](auto &execs) -> Result<void> {
    auto it = execs.find(id);
    if (it == execs.end() || it->second.meta.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &rec = it->second;
    if (rec.meta.status != ExecutionStatus::Queued) {
      return fail(Error::InvalidState);
    }
    rec.meta.status = ExecutionStatus::Running;
    rec.meta.started_at = now;
    auto started = rec.run.start_ready(now);
    transition.dispatches = dispatches_for(rec, started);
    return ok();
  });
  if (!res) {
    return fail(res.error());
  }

  log::debug("Execution {} started with {} step(s)", id,
             transition.dispatches.size());
  auto dispatches = transition.dispatches;
  emit(std::move(transition));
  return ok(std::move(dispatches));
}

auto PipelineExecutor::ready_steps(const TenantId &tenant,
                                   const ExecutionId &id) const
    -> Result<std::vector<std::string>> {
  return executions_.with_shard(
      id, [&](const auto &execs) -> Result<std::vector<std::string>> {
        auto it = execs.find(id);
        if (it == execs.end() || it->second.meta.tenant != tenant) {
          return fail(Error::NotFound);
        }
        std::vector<std::string> names;
        for (NodeIndex idx : it->second.run.ready_steps()) {
          names.push_back(it->second.run.graph().name_of(idx));
        }
        return ok(std::move(names));
      });
}

template <typename Fn>
auto PipelineExecutor::apply_step_result(const TenantId &tenant,
                                         const ExecutionId &id,
                                         std::string_view step, Fn &&fn)
    -> Result<std::vector<StepDispatch>> {
  const auto now = clock_.now();
  Transition transition;

  auto res = executions_.with_shard(id, [&](auto &execs) -> Result<void> {
    auto it = execs.find(id);
    if (it == execs.end() || it->second.meta.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &rec = it->second;
    if (rec.meta.status != ExecutionStatus::Running) {
      return fail(Error::InvalidState);
    }
    NodeIndex idx = rec.run.find(step);
    if (idx == kInvalidNode) {
      return fail(Error::NotFound);
    }
    if (auto r = fn(rec.run, idx, now); !r) {
      return fail(r.error());
    }

    auto started = rec.run.start_ready(now);
    transition.dispatches = dispatches_for(rec, started);
    if (rec.run.is_complete()) {
      if (rec.run.has_failed()) {
        std::string error;
        for (const auto &info : rec.run.steps()) {
          if (info.status == StepStatus::Failed) {
            error = std::format("step '{}' failed: {}",
                                rec.run.graph().name_of(info.idx), info.error);
            break;
          }
        }
        finalize(rec, ExecutionStatus::Failed, std::move(error), now);
      } else {
        finalize(rec, ExecutionStatus::Completed, {}, now);
      }
      transition.finished = snapshot(rec);
    }
    return ok();
  });

  if (!res) {
    if (res.error() == make_error_code(Error::InvalidState)) {
      log::debug("Discarded late result for step {} of execution {}", step,
                 id);
    }
    return fail(res.error());
  }

  auto dispatches = transition.dispatches;
  emit(std::move(transition));
  return ok(std::move(dispatches));
}

auto PipelineExecutor::complete_step(const TenantId &tenant,
                                     const ExecutionId &id,
                                     std::string_view step, std::string output)
    -> Result<std::vector<StepDispatch>> {
  return apply_step_result(
      tenant, id, step,
      [&](PipelineRun &run, NodeIndex idx, TimePoint now) -> Result<void> {
        return run.mark_completed(idx, std::move(output), now);
      });
}

auto PipelineExecutor::fail_step(const TenantId &tenant, const ExecutionId &id,
                                 std::string_view step, std::string error)
    -> Result<std::vector<StepDispatch>> {
  return apply_step_result(
      tenant, id, step,
      [&](PipelineRun &run, NodeIndex idx, TimePoint now) -> Result<void> {
        auto outcome = run.mark_failed(idx, std::move(error), now);
        if (!outcome) {
          return fail(outcome.error());
        }
        if (*outcome == FailureOutcome::Failed) {
          log::warn("Step {} of execution {} failed permanently", step, id);
        }
        return ok();
      });
}

auto PipelineExecutor::cancel(const TenantId &tenant, const ExecutionId &id)
    -> Result<void> {
  const auto now = clock_.now();
  Transition transition;

  auto res = executions_.with_shard(id, [&](auto &execs) -> Result<void> {
    auto it = execs.find(id);
    if (it == execs.end() || it->second.meta.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &rec = it->second;
    if (is_terminal(rec.meta.status)) {
      return fail(Error::InvalidState);
    }
    rec.run.cancel(now);
    finalize(rec, ExecutionStatus::Cancelled, "cancelled", now);
    transition.finished = snapshot(rec);
    return ok();
  });
  if (!res) {
    return res;
  }

  log::info("Execution {} cancelled", id);
  emit(std::move(transition));
  return ok();
}

auto PipelineExecutor::reap_timeouts(TimePoint now) -> std::size_t {
  std::vector<PipelineExecution> timed_out;
  executions_.for_each_shard([&](auto &execs) {
    for (auto &[id, rec] : execs) {
      if (rec.meta.status != ExecutionStatus::Running || !rec.meta.started_at) {
        continue;
      }
      if (now - *rec.meta.started_at < rec.def->timeout) {
        continue;
      }
      rec.run.cancel(now);
      finalize(rec, ExecutionStatus::Timeout,
               std::format("execution exceeded {}s timeout",
                           rec.def->timeout.count()),
               now);
      timed_out.push_back(snapshot(rec));
    }
  });

  for (auto &exec : timed_out) {
    log::warn("Execution {} of pipeline {} timed out", exec.id, exec.pipeline);
    emit(Transition{.dispatches = {}, .finished = std::move(exec)});
  }
  return timed_out.size();
}

auto PipelineExecutor::purge_finished_before(TimePoint cutoff)
    -> std::size_t {
  std::size_t purged = 0;
  executions_.for_each_shard([&](auto &execs) {
    std::vector<ExecutionId> expired;
    for (const auto &[id, rec] : execs) {
      if (is_terminal(rec.meta.status) && rec.meta.completed_at &&
          *rec.meta.completed_at < cutoff) {
        expired.push_back(id);
      }
    }
    for (const auto &id : expired) {
      execs.erase(id);
    }
    purged += expired.size();
  });
  if (purged > 0) {
    log::info("Purged {} finished execution(s)", purged);
  }
  return purged;
}

auto PipelineExecutor::get_execution(const TenantId &tenant,
                                     const ExecutionId &id) const
    -> Result<PipelineExecution> {
  return executions_.with_shard(
      id, [&](const auto &execs) -> Result<PipelineExecution> {
        auto it = execs.find(id);
        if (it == execs.end() || it->second.meta.tenant != tenant) {
          return fail(Error::NotFound);
        }
        return ok(snapshot(it->second));
      });
}

auto PipelineExecutor::executions_of(const TenantId &tenant,
                                     const PipelineId &pipeline) const
    -> std::vector<PipelineExecution> {
  std::vector<PipelineExecution> out;
  executions_.for_each_shard([&](const auto &execs) {
    for (const auto &[id, rec] : execs) {
      if (rec.meta.tenant == tenant && rec.meta.pipeline == pipeline) {
        out.push_back(snapshot(rec));
      }
    }
  });
  std::ranges::sort(out, {}, &PipelineExecution::created_at);
  return out;
}

auto PipelineExecutor::active_count(const TenantId &tenant,
                                    const PipelineId &pipeline) const
    -> Result<int> {
  return pipelines_.with_shard(pipeline, [&](const auto &slots) -> Result<int> {
    auto it = slots.find(pipeline);
    if (it == slots.end() || it->second.def->tenant != tenant) {
      return fail(Error::NotFound);
    }
    return ok(static_cast<int>(it->second.active.size()));
  });
}

auto PipelineExecutor::release_slot(const PipelineId &pipeline,
                                    const ExecutionId &id) -> void {
  pipelines_.with_shard(pipeline, [&](auto &slots) {
    if (auto it = slots.find(pipeline); it != slots.end()) {
      it->second.active.erase(id);
    }
  });
}

// Cancelled executions are not samples; timeouts count as failures.
auto PipelineExecutor::record_stats(const PipelineExecution &exec) -> void {
  if (exec.status == ExecutionStatus::Cancelled || !exec.completed_at) {
    return;
  }
  const bool success = exec.status == ExecutionStatus::Completed;
  const auto at = *exec.completed_at;
  const auto cutoff = at - options_.stats_window;

  stats_.with_shard(exec.pipeline, [&](auto &states) {
    auto &state = states[exec.pipeline];
    state.samples.push_back(Sample{
        .at = at,
        .success = success,
        .duration = success ? exec.duration : std::nullopt});
    while (!state.samples.empty() && state.samples.front().at < cutoff) {
      state.samples.pop_front();
    }

    auto &summary = state.summary;
    if (success) {
      ++summary.success_count;
    } else {
      ++summary.failure_count;
    }

    std::int64_t successes = 0;
    std::int64_t timed = 0;
    std::chrono::milliseconds total{0};
    for (const auto &sample : state.samples) {
      if (sample.success) {
        ++successes;
      }
      if (sample.duration) {
        ++timed;
        total += *sample.duration;
      }
    }
    summary.success_rate = state.samples.empty()
                               ? 0.0
                               : 100.0 * static_cast<double>(successes) /
                                     static_cast<double>(state.samples.size());
    summary.average_duration =
        timed == 0 ? std::chrono::milliseconds{0} : total / timed;
  });
}

auto PipelineExecutor::emit(Transition transition) -> void {
  if (transition.finished) {
    const auto &exec = *transition.finished;
    release_slot(exec.pipeline, exec.id);
    record_stats(exec);
    log::info("Execution {} of pipeline {} finished: {}", exec.id,
              exec.pipeline, to_string_view(exec.status));
  }

  if (callbacks_.on_step_ready) {
    for (const auto &dispatch : transition.dispatches) {
      callbacks_.on_step_ready(dispatch);
    }
  }
  if (transition.finished && callbacks_.on_execution_finished) {
    callbacks_.on_execution_finished(*transition.finished);
  }
}

} // namespace conductor
