#include "conductor/agent/agent_scheduler.hpp"

#include "conductor/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace conductor {

AgentScheduler::AgentScheduler(const Clock &clock, AgentSchedulerOptions options,
                               std::size_t shards)
    : clock_(clock), options_(options), agents_(shards), names_(shards),
      tasks_(shards) {}

auto AgentScheduler::set_callbacks(AgentCallbacks callbacks) -> void {
  callbacks_ = std::move(callbacks);
}

auto AgentScheduler::set_executor(std::shared_ptr<IAgentExecutor> executor)
    -> void {
  executor_ = std::move(executor);
}

auto AgentScheduler::register_agent(const TenantId &tenant, AgentSpec spec)
    -> Result<AgentId> {
  if (!is_valid_id_text(tenant.value()) || !is_valid_id_text(spec.name) ||
      spec.type.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (spec.max_concurrent_tasks <= 0 || spec.timeout.count() < 0) {
    return fail(Error::InvalidArgument);
  }

  const auto now = clock_.now();
  auto id = generate_id<AgentId>("agent");
  Agent agent{.id = id,
              .tenant = tenant,
              .name = spec.name,
              .type = std::move(spec.type),
              .status = spec.status,
              .capabilities = std::move(spec.capabilities),
              .max_concurrent_tasks = spec.max_concurrent_tasks,
              .timeout = spec.timeout.count() == 0 ? options_.default_timeout
                                                   : spec.timeout,
              .success_rate = 0.0,
              .average_completion_time = {},
              .total_tasks_completed = 0,
              .total_tokens_used = 0,
              .total_cost_cents = 0,
              .last_used_at = std::nullopt,
              .created_at = now};

  NameKey key{.tenant = tenant, .name = std::move(spec.name)};
  auto res = names_.with_shard(key, [&](auto &names) -> Result<void> {
    if (names.contains(key)) {
      return fail(Error::AlreadyExists);
    }
    names.emplace(key, id);
    agents_.with_shard(id, [&](auto &records) {
      records.emplace(id, AgentRecord{.agent = std::move(agent),
                                      .in_flight = 0,
                                      .samples = {}});
    });
    return ok();
  });
  if (!res) {
    return fail(res.error());
  }

  log::info("Registered agent {} ({}) for tenant {}", key.name, id, tenant);
  return ok(std::move(id));
}

auto AgentScheduler::set_status(const TenantId &tenant, const AgentId &id,
                                AgentStatus status) -> Result<void> {
  return agents_.with_shard(id, [&](auto &records) -> Result<void> {
    auto it = records.find(id);
    if (it == records.end() || it->second.agent.tenant != tenant) {
      return fail(Error::NotFound);
    }
    it->second.agent.status = status;
    log::info("Agent {} is now {}", id, to_string_view(status));
    return ok();
  });
}

auto AgentScheduler::set_capability(const TenantId &tenant, const AgentId &id,
                                    std::string_view capability, bool enabled)
    -> Result<void> {
  if (capability.empty()) {
    return fail(Error::InvalidArgument);
  }
  return agents_.with_shard(id, [&](auto &records) -> Result<void> {
    auto it = records.find(id);
    if (it == records.end() || it->second.agent.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &caps = it->second.agent.capabilities;
    auto cap = std::ranges::find(caps, capability, &Capability::name);
    if (cap == caps.end()) {
      caps.push_back(Capability{.name = std::string(capability),
                                .enabled = enabled,
                                .usage_count = 0,
                                .success_count = 0});
    } else {
      cap->enabled = enabled;
    }
    return ok();
  });
}

auto AgentScheduler::get_agent(const TenantId &tenant, const AgentId &id) const
    -> Result<Agent> {
  auto rec = agents_.find_copy(id);
  if (!rec || rec->agent.tenant != tenant) {
    return fail(Error::NotFound);
  }
  return ok(std::move(rec->agent));
}

auto AgentScheduler::agents(const TenantId &tenant) const
    -> std::vector<Agent> {
  std::vector<Agent> out;
  agents_.for_each_shard([&](const auto &records) {
    for (const auto &[id, rec] : records) {
      if (rec.agent.tenant == tenant) {
        out.push_back(rec.agent);
      }
    }
  });
  std::ranges::sort(out, {}, &Agent::name);
  return out;
}

auto AgentScheduler::in_flight(const TenantId &tenant, const AgentId &id) const
    -> Result<int> {
  return agents_.with_shard(id, [&](const auto &records) -> Result<int> {
    auto it = records.find(id);
    if (it == records.end() || it->second.agent.tenant != tenant) {
      return fail(Error::NotFound);
    }
    return ok(it->second.in_flight);
  });
}

auto AgentScheduler::enqueue(const TenantId &tenant, const AgentId &agent,
                             AgentTaskRequest request) -> Result<AgentTaskId> {
  if (request.priority < 1 || request.priority > 5 ||
      request.max_retries.value_or(0) < 0) {
    return fail(Error::InvalidArgument);
  }

  const auto now = clock_.now();
  auto task_id = generate_id<AgentTaskId>("atask");

  auto res = agents_.with_shard(agent, [&](auto &records) -> Result<void> {
    auto it = records.find(agent);
    if (it == records.end() || it->second.agent.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &rec = it->second;
    if (rec.agent.status != AgentStatus::Active) {
      return fail(Error::InvalidState);
    }
    if (rec.in_flight >= rec.agent.max_concurrent_tasks) {
      return fail(Error::CapacityExceeded);
    }

    AgentTask task{
        .id = task_id,
        .agent = agent,
        .tenant = tenant,
        .task = std::move(request.task),
        .step = std::move(request.step),
        .task_type = request.task_type.empty() ? rec.agent.type
                                               : std::move(request.task_type),
        .prompt = std::move(request.prompt),
        .context = std::move(request.context),
        .status = AgentTaskStatus::Queued,
        .priority = request.priority,
        .retry_count = 0,
        .max_retries =
            request.max_retries.value_or(options_.default_max_retries),
        .required_capabilities = std::move(request.required_capabilities),
        .timeout = rec.agent.timeout,
        .created_at = now,
        .started_at = std::nullopt,
        .completed_at = std::nullopt,
        .duration = std::nullopt,
        .result = {},
        .tokens_used = 0,
        .cost_cents = 0,
        .capabilities_used = {},
        .error_message = {}};
    tasks_.with_shard(task_id, [&](auto &tasks) {
      tasks.emplace(task_id, std::move(task));
    });
    ++rec.in_flight;
    return ok();
  });

  if (!res) {
    log::warn("Enqueue to agent {} rejected: {}", agent, res.error().message());
    return fail(res.error());
  }
  log::debug("Agent task {} queued on agent {}", task_id, agent);
  return ok(std::move(task_id));
}

auto AgentScheduler::ranked_candidates(
    const TenantId &tenant, std::string_view task_type,
    std::span<const std::string> required_capabilities) const
    -> std::vector<AgentId> {
  struct Candidate {
    AgentId id;
    double success_rate;
    std::chrono::milliseconds average;
  };
  std::vector<Candidate> candidates;

  agents_.for_each_shard([&](const auto &records) {
    for (const auto &[id, rec] : records) {
      const auto &agent = rec.agent;
      if (agent.tenant != tenant || agent.status != AgentStatus::Active ||
          agent.type != task_type ||
          rec.in_flight >= agent.max_concurrent_tasks) {
        continue;
      }
      const bool capable = std::ranges::all_of(
          required_capabilities,
          [&](const std::string &cap) { return agent.has_enabled(cap); });
      if (!capable) {
        continue;
      }
      candidates.push_back(Candidate{.id = id,
                                     .success_rate = agent.success_rate,
                                     .average = agent.average_completion_time});
    }
  });

  std::ranges::sort(candidates, [](const Candidate &a, const Candidate &b) {
    if (a.success_rate != b.success_rate) {
      return a.success_rate > b.success_rate;
    }
    if (a.average != b.average) {
      return a.average < b.average;
    }
    return a.id < b.id;
  });

  std::vector<AgentId> out;
  out.reserve(candidates.size());
  for (auto &c : candidates) {
    out.push_back(std::move(c.id));
  }
  return out;
}

auto AgentScheduler::select_best_agent(
    const TenantId &tenant, std::string_view task_type,
    std::span<const std::string> required_capabilities) const
    -> Result<AgentId> {
  auto ranked = ranked_candidates(tenant, task_type, required_capabilities);
  if (ranked.empty()) {
    return fail(Error::NoAgentAvailable);
  }
  return ok(std::move(ranked.front()));
}

auto AgentScheduler::schedule(const TenantId &tenant, AgentTaskRequest request)
    -> Result<AgentTaskId> {
  auto ranked = ranked_candidates(tenant, request.task_type,
                                  request.required_capabilities);
  for (const auto &agent : ranked) {
    auto res = enqueue(tenant, agent, request);
    if (res) {
      return res;
    }
    if (res.error() != make_error_code(Error::CapacityExceeded) &&
        res.error() != make_error_code(Error::InvalidState)) {
      return res;
    }
  }
  log::warn("No agent available for task type '{}' in tenant {}",
            request.task_type, tenant);
  return fail(Error::NoAgentAvailable);
}

auto AgentScheduler::run_task(const TenantId &tenant, const AgentTaskId &id)
    -> Result<AgentTaskStatus> {
  if (!executor_) {
    log::error("Agent task {} cannot run: no agent executor configured", id);
    return fail(Error::InvalidState);
  }

  const auto now = clock_.now();
  AgentRequest request;
  auto started = tasks_.with_shard(id, [&](auto &tasks) -> Result<void> {
    auto it = tasks.find(id);
    if (it == tasks.end() || it->second.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &task = it->second;
    if (task.status != AgentTaskStatus::Queued) {
      return fail(Error::InvalidState);
    }
    task.status = AgentTaskStatus::Running;
    task.started_at = now;
    request = AgentRequest{.task = id,
                           .prompt = task.prompt,
                           .context = task.context,
                           .task_type = task.task_type};
    return ok();
  });
  if (!started) {
    return fail(started.error());
  }

  std::string failure;
  std::optional<AgentResult> result;
  try {
    auto res = executor_->execute(request);
    if (res) {
      result = std::move(*res);
    } else {
      failure = res.error().message();
    }
  } catch (const std::exception &e) {
    failure = std::format("agent executor threw: {}", e.what());
  }

  if (result && result->status == AgentTaskStatus::Completed) {
    if (auto r = complete_task(tenant, id, std::move(*result)); !r) {
      return fail(r.error());
    }
    return ok(AgentTaskStatus::Completed);
  }
  if (result) {
    failure = result->error.empty() ? "agent reported failure" : result->error;
  }
  return fail_task(tenant, id, std::move(failure));
}

template <typename Fn>
auto AgentScheduler::finish_task(const TenantId &tenant, const AgentTaskId &id,
                                 Fn &&mutate) -> Result<AgentTask> {
  return tasks_.with_shard(id, [&](auto &tasks) -> Result<AgentTask> {
    auto it = tasks.find(id);
    if (it == tasks.end() || it->second.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &task = it->second;
    if (is_terminal(task.status)) {
      return fail(Error::InvalidState);
    }
    if (auto r = mutate(task); !r) {
      return fail(r.error());
    }
    return ok(task);
  });
}

auto AgentScheduler::complete_task(const TenantId &tenant,
                                   const AgentTaskId &id, AgentResult result)
    -> Result<void> {
  const auto now = clock_.now();
  auto done = finish_task(tenant, id, [&](AgentTask &task) -> Result<void> {
    if (task.status != AgentTaskStatus::Running) {
      return fail(Error::InvalidState);
    }
    task.status = AgentTaskStatus::Completed;
    task.completed_at = now;
    if (task.started_at) {
      task.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          now - *task.started_at);
    }
    task.result = std::move(result.result);
    task.tokens_used = result.tokens_used;
    task.cost_cents = result.cost_cents;
    task.capabilities_used = std::move(result.capabilities_used);
    task.error_message.clear();
    return ok();
  });
  if (!done) {
    log::debug("Discarded result for agent task {}: {}", id,
               done.error().message());
    return fail(done.error());
  }

  log::debug("Agent task {} completed", id);
  release(*done);
  return ok();
}

auto AgentScheduler::fail_task(const TenantId &tenant, const AgentTaskId &id,
                               std::string error) -> Result<AgentTaskStatus> {
  const auto now = clock_.now();
  std::optional<AgentTask> requeued;
  std::optional<AgentTask> failed;

  auto res = tasks_.with_shard(id, [&](auto &tasks) -> Result<void> {
    auto it = tasks.find(id);
    if (it == tasks.end() || it->second.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &task = it->second;
    if (task.status != AgentTaskStatus::Running) {
      return fail(Error::InvalidState);
    }
    task.error_message = std::move(error);
    if (task.retry_count < task.max_retries) {
      ++task.retry_count;
      task.status = AgentTaskStatus::Queued;
      task.started_at.reset();
      requeued = task;
      return ok();
    }
    task.status = AgentTaskStatus::Failed;
    task.completed_at = now;
    failed = task;
    return ok();
  });
  if (!res) {
    log::debug("Discarded failure for agent task {}: {}", id,
               res.error().message());
    return fail(res.error());
  }

  if (requeued) {
    log::warn("Agent task {} failed, requeued ({}/{}): {}", id,
              requeued->retry_count, requeued->max_retries,
              requeued->error_message);
    if (callbacks_.on_task_requeued) {
      callbacks_.on_task_requeued(*requeued);
    }
    return ok(AgentTaskStatus::Queued);
  }

  log::error("Agent task {} failed permanently: {}", id, failed->error_message);
  release(*failed);
  return ok(AgentTaskStatus::Failed);
}

auto AgentScheduler::cancel_task(const TenantId &tenant, const AgentTaskId &id)
    -> Result<void> {
  const auto now = clock_.now();
  auto done = finish_task(tenant, id, [&](AgentTask &task) -> Result<void> {
    task.status = AgentTaskStatus::Cancelled;
    task.completed_at = now;
    return ok();
  });
  if (!done) {
    return fail(done.error());
  }
  log::info("Agent task {} cancelled", id);
  release(*done);
  return ok();
}

auto AgentScheduler::reap_timeouts(TimePoint now) -> std::size_t {
  std::vector<AgentTask> timed_out;
  tasks_.for_each_shard([&](auto &tasks) {
    for (auto &[id, task] : tasks) {
      if (task.status != AgentTaskStatus::Running || !task.started_at ||
          now - *task.started_at < task.timeout) {
        continue;
      }
      task.status = AgentTaskStatus::Timeout;
      task.completed_at = now;
      task.error_message =
          std::format("agent task exceeded {}s timeout", task.timeout.count());
      timed_out.push_back(task);
    }
  });

  for (const auto &task : timed_out) {
    log::warn("Agent task {} on agent {} timed out", task.id, task.agent);
    release(task);
  }
  return timed_out.size();
}

auto AgentScheduler::purge_finished_before(TimePoint cutoff) -> std::size_t {
  std::size_t purged = 0;
  tasks_.for_each_shard([&](auto &tasks) {
    std::vector<AgentTaskId> expired;
    for (const auto &[id, task] : tasks) {
      if (is_terminal(task.status) && task.completed_at &&
          *task.completed_at < cutoff) {
        expired.push_back(id);
      }
    }
    for (const auto &id : expired) {
      tasks.erase(id);
    }
    purged += expired.size();
  });
  if (purged > 0) {
    log::info("Purged {} finished agent task(s)", purged);
  }
  return purged;
}

// Frees the capacity slot and folds the outcome into the agent statistics.
auto AgentScheduler::release(const AgentTask &task) -> void {
  agents_.with_shard(task.agent, [&](auto &records) {
    auto it = records.find(task.agent);
    if (it == records.end()) {
      return;
    }
    auto &rec = it->second;
    auto &agent = rec.agent;
    rec.in_flight = std::max(rec.in_flight - 1, 0);

    if (task.status == AgentTaskStatus::Cancelled || !task.completed_at) {
      return;
    }
    const bool success = task.status == AgentTaskStatus::Completed;
    const auto at = *task.completed_at;

    const auto &used = task.capabilities_used.empty()
                           ? task.required_capabilities
                           : task.capabilities_used;
    for (const auto &name : used) {
      auto cap = std::ranges::find(agent.capabilities, name, &Capability::name);
      if (cap == agent.capabilities.end()) {
        continue;
      }
      ++cap->usage_count;
      if (success) {
        ++cap->success_count;
      }
    }

    if (success) {
      ++agent.total_tasks_completed;
    }
    agent.total_tokens_used += task.tokens_used;
    agent.total_cost_cents += task.cost_cents;
    agent.last_used_at = at;

    rec.samples.push_back(Sample{
        .at = at,
        .success = success,
        .duration = success ? task.duration : std::nullopt});
    const auto cutoff = at - options_.stats_window;
    while (!rec.samples.empty() && rec.samples.front().at < cutoff) {
      rec.samples.pop_front();
    }

    std::int64_t successes = 0;
    std::int64_t timed = 0;
    std::chrono::milliseconds total{0};
    for (const auto &sample : rec.samples) {
      if (sample.success) {
        ++successes;
      }
      if (sample.duration) {
        ++timed;
        total += *sample.duration;
      }
    }
    agent.success_rate = rec.samples.empty()
                             ? 0.0
                             : 100.0 * static_cast<double>(successes) /
                                   static_cast<double>(rec.samples.size());
    agent.average_completion_time =
        timed == 0 ? std::chrono::milliseconds{0} : total / timed;
  });

  if (callbacks_.on_task_finished) {
    callbacks_.on_task_finished(task);
  }
}

auto AgentScheduler::get_task(const TenantId &tenant,
                              const AgentTaskId &id) const
    -> Result<AgentTask> {
  auto task = tasks_.find_copy(id);
  if (!task || task->tenant != tenant) {
    return fail(Error::NotFound);
  }
  return ok(std::move(*task));
}

auto AgentScheduler::tasks_of(const TenantId &tenant,
                              const AgentId &agent) const
    -> std::vector<AgentTask> {
  std::vector<AgentTask> out;
  tasks_.for_each_shard([&](const auto &tasks) {
    for (const auto &[id, task] : tasks) {
      if (task.tenant == tenant && task.agent == agent) {
        out.push_back(task);
      }
    }
  });
  std::ranges::sort(out, {}, &AgentTask::created_at);
  return out;
}

auto AgentScheduler::next_queued(const TenantId &tenant,
                                 const AgentId &agent) const
    -> Result<AgentTask> {
  std::optional<AgentTask> best;
  tasks_.for_each_shard([&](const auto &tasks) {
    for (const auto &[id, task] : tasks) {
      if (task.tenant != tenant || task.agent != agent ||
          task.status != AgentTaskStatus::Queued) {
        continue;
      }
      if (!best || task.priority < best->priority ||
          (task.priority == best->priority &&
           task.created_at < best->created_at)) {
        best = task;
      }
    }
  });
  if (!best) {
    return fail(Error::NotFound);
  }
  return ok(std::move(*best));
}

} // namespace conductor
