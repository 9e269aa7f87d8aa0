#pragma once

#include "conductor/agent/agent.hpp"
#include "conductor/agent/agent_executor.hpp"
#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/util/hash.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/sharded_map.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

struct AgentSchedulerOptions {
  std::chrono::seconds default_timeout{defaults::kAgentTimeout};
  int default_max_retries{defaults::kAgentTaskMaxRetries};
  std::chrono::seconds stats_window{defaults::kStatsWindow};
};

struct AgentCallbacks {
  // Terminal transition of an agent task, after its capacity slot is freed.
  std::move_only_function<void(const AgentTask &)> on_task_finished;
  // A failed attempt went back to queued.
  std::move_only_function<void(const AgentTask &)> on_task_requeued;
};

// Capacity-limited dispatch of work to registered agents.
//
// An agent's in-flight count (queued + running tasks) lives next to the
// agent record and is only changed under that agent's shard lock, so the
// capacity check and the enqueue are one step. Lock order: agent, then
// task.
class AgentScheduler {
public:
  explicit AgentScheduler(const Clock &clock = system_clock(),
                          AgentSchedulerOptions options = {},
                          std::size_t shards = defaults::kShardCount);

  AgentScheduler(const AgentScheduler &) = delete;
  auto operator=(const AgentScheduler &) -> AgentScheduler & = delete;

  auto set_callbacks(AgentCallbacks callbacks) -> void;
  auto set_executor(std::shared_ptr<IAgentExecutor> executor) -> void;
  [[nodiscard]] auto has_executor() const noexcept -> bool {
    return executor_ != nullptr;
  }

  [[nodiscard]] auto register_agent(const TenantId &tenant, AgentSpec spec)
      -> Result<AgentId>;
  [[nodiscard]] auto set_status(const TenantId &tenant, const AgentId &id,
                                AgentStatus status) -> Result<void>;
  // Adds the capability when the agent does not have it yet.
  [[nodiscard]] auto set_capability(const TenantId &tenant, const AgentId &id,
                                    std::string_view capability, bool enabled)
      -> Result<void>;
  [[nodiscard]] auto get_agent(const TenantId &tenant, const AgentId &id) const
      -> Result<Agent>;
  [[nodiscard]] auto agents(const TenantId &tenant) const -> std::vector<Agent>;
  [[nodiscard]] auto in_flight(const TenantId &tenant, const AgentId &id) const
      -> Result<int>;

  [[nodiscard]] auto enqueue(const TenantId &tenant, const AgentId &agent,
                             AgentTaskRequest request) -> Result<AgentTaskId>;

  [[nodiscard]] auto select_best_agent(
      const TenantId &tenant, std::string_view task_type,
      std::span<const std::string> required_capabilities) const
      -> Result<AgentId>;
  // Selection followed by enqueue; falls through to the next candidate when
  // the chosen agent fills up in between.
  [[nodiscard]] auto schedule(const TenantId &tenant, AgentTaskRequest request)
      -> Result<AgentTaskId>;

  // Runs one queued task through the executor and records the outcome.
  [[nodiscard]] auto run_task(const TenantId &tenant, const AgentTaskId &id)
      -> Result<AgentTaskStatus>;
  [[nodiscard]] auto complete_task(const TenantId &tenant,
                                   const AgentTaskId &id, AgentResult result)
      -> Result<void>;
  // Requeues while retries remain; returns the resulting status.
  [[nodiscard]] auto fail_task(const TenantId &tenant, const AgentTaskId &id,
                               std::string error) -> Result<AgentTaskStatus>;
  [[nodiscard]] auto cancel_task(const TenantId &tenant, const AgentTaskId &id)
      -> Result<void>;
  auto reap_timeouts(TimePoint now) -> std::size_t;
  // Drops terminal tasks completed before `cutoff`. Agent statistics are
  // already folded in and stay.
  auto purge_finished_before(TimePoint cutoff) -> std::size_t;

  [[nodiscard]] auto get_task(const TenantId &tenant,
                              const AgentTaskId &id) const -> Result<AgentTask>;
  [[nodiscard]] auto tasks_of(const TenantId &tenant, const AgentId &agent) const
      -> std::vector<AgentTask>;
  // Most urgent queued task of an agent: lowest priority value, then oldest.
  [[nodiscard]] auto next_queued(const TenantId &tenant,
                                 const AgentId &agent) const
      -> Result<AgentTask>;

private:
  struct NameKey {
    TenantId tenant;
    std::string name;
    auto operator==(const NameKey &) const -> bool = default;
  };
  struct NameKeyHash {
    auto operator()(const NameKey &key) const noexcept -> std::size_t {
      return util::combine(key.tenant, key.name);
    }
  };

  struct Sample {
    TimePoint at;
    bool success{false};
    std::optional<std::chrono::milliseconds> duration;
  };

  struct AgentRecord {
    Agent agent;
    int in_flight{0};
    std::deque<Sample> samples;
  };

  [[nodiscard]] auto ranked_candidates(
      const TenantId &tenant, std::string_view task_type,
      std::span<const std::string> required_capabilities) const
      -> std::vector<AgentId>;

  // Marks a non-terminal task terminal under its lock; returns the snapshot.
  template <typename Fn>
  [[nodiscard]] auto finish_task(const TenantId &tenant, const AgentTaskId &id,
                                 Fn &&mutate) -> Result<AgentTask>;
  auto release(const AgentTask &task) -> void;

  const Clock &clock_;
  AgentSchedulerOptions options_;
  util::ShardedMap<AgentId, AgentRecord> agents_;
  util::ShardedMap<NameKey, AgentId, NameKeyHash> names_;
  util::ShardedMap<AgentTaskId, AgentTask> tasks_;
  std::shared_ptr<IAgentExecutor> executor_;
  AgentCallbacks callbacks_;
};

} // namespace conductor
