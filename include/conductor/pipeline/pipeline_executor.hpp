#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/pipeline/pipeline.hpp"
#include "conductor/pipeline/pipeline_run.hpp"
#include "conductor/pipeline/step_graph.hpp"
#include "conductor/util/hash.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/sharded_map.hpp"

#include <ankerl/unordered_dense.h>

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

struct PipelineExecutorOptions {
  // Used when a definition leaves the corresponding field at 0.
  int default_max_concurrent{defaults::kPipelineConcurrency};
  std::chrono::seconds default_timeout{defaults::kPipelineTimeout};
  std::chrono::seconds stats_window{defaults::kStatsWindow};
};

struct PipelineCallbacks {
  std::move_only_function<void(const StepDispatch &)> on_step_ready;
  std::move_only_function<void(const PipelineExecution &)>
      on_execution_finished;
};

// Registry of pipeline definitions plus the executions created from them.
//
// Lock order: pipeline shard, then execution shard. Execution results are
// applied under the execution lock only; the pipeline's admission slot is
// released afterwards, so a finishing execution never blocks a trigger for
// longer than the slot release itself.
class PipelineExecutor {
public:
  explicit PipelineExecutor(const Clock &clock = system_clock(),
                            PipelineExecutorOptions options = {},
                            std::size_t shards = defaults::kShardCount);

  PipelineExecutor(const PipelineExecutor &) = delete;
  auto operator=(const PipelineExecutor &) -> PipelineExecutor & = delete;

  auto set_callbacks(PipelineCallbacks callbacks) -> void;

  [[nodiscard]] auto register_pipeline(const TenantId &tenant,
                                       PipelineDefinition def)
      -> Result<PipelineId>;
  // Replaces the definition identified by def.id. Running executions keep
  // the snapshot they were created with.
  [[nodiscard]] auto update_pipeline(const TenantId &tenant,
                                     PipelineDefinition def) -> Result<int>;
  [[nodiscard]] auto get_pipeline(const TenantId &tenant,
                                  const PipelineId &id) const
      -> Result<PipelineDefinition>;
  [[nodiscard]] auto find_pipeline(const TenantId &tenant,
                                   std::string_view name) const
      -> Result<PipelineDefinition>;
  [[nodiscard]] auto pipelines(const TenantId &tenant) const
      -> std::vector<PipelineDefinition>;
  [[nodiscard]] auto pipelines_for_event(const TenantId &tenant,
                                         std::string_view event_type) const
      -> std::vector<PipelineDefinition>;
  [[nodiscard]] auto set_active(const TenantId &tenant, const PipelineId &id,
                                bool active) -> Result<void>;
  [[nodiscard]] auto stats(const TenantId &tenant, const PipelineId &id) const
      -> Result<PipelineStats>;

  [[nodiscard]] auto trigger(const TenantId &tenant,
                             const PipelineId &pipeline,
                             TriggerRequest request) -> Result<ExecutionId>;
  // queued -> running; returns the root steps, already running.
  [[nodiscard]] auto start(const TenantId &tenant, const ExecutionId &id)
      -> Result<std::vector<StepDispatch>>;
  [[nodiscard]] auto ready_steps(const TenantId &tenant,
                                 const ExecutionId &id) const
      -> Result<std::vector<std::string>>;

  // Both return the steps that became running as a consequence.
  [[nodiscard]] auto complete_step(const TenantId &tenant,
                                   const ExecutionId &id,
                                   std::string_view step, std::string output)
      -> Result<std::vector<StepDispatch>>;
  [[nodiscard]] auto fail_step(const TenantId &tenant, const ExecutionId &id,
                               std::string_view step, std::string error)
      -> Result<std::vector<StepDispatch>>;

  [[nodiscard]] auto cancel(const TenantId &tenant, const ExecutionId &id)
      -> Result<void>;
  // Running executions older than their pipeline timeout become `timeout`.
  auto reap_timeouts(TimePoint now) -> std::size_t;
  // Drops terminal executions that finished before `cutoff`.
  auto purge_finished_before(TimePoint cutoff) -> std::size_t;

  [[nodiscard]] auto get_execution(const TenantId &tenant,
                                   const ExecutionId &id) const
      -> Result<PipelineExecution>;
  [[nodiscard]] auto executions_of(const TenantId &tenant,
                                   const PipelineId &pipeline) const
      -> std::vector<PipelineExecution>;
  [[nodiscard]] auto active_count(const TenantId &tenant,
                                  const PipelineId &pipeline) const
      -> Result<int>;

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

  struct Slot {
    std::shared_ptr<const PipelineDefinition> def;
    std::shared_ptr<const StepGraph> graph;
    ankerl::unordered_dense::set<ExecutionId> active;
  };

  struct Record {
    PipelineExecution meta;
    std::shared_ptr<const PipelineDefinition> def;
    PipelineRun run;
  };

  struct Sample {
    TimePoint at;
    bool success{false};
    std::optional<std::chrono::milliseconds> duration;
  };
  struct StatsState {
    std::deque<Sample> samples;
    PipelineStats summary;
  };

  struct Transition {
    std::vector<StepDispatch> dispatches;
    std::optional<PipelineExecution> finished;
  };

  [[nodiscard]] auto prepare(const TenantId &tenant, PipelineDefinition &def,
                             std::shared_ptr<const StepGraph> &graph) const
      -> Result<void>;

  [[nodiscard]] static auto snapshot(const Record &rec) -> PipelineExecution;
  [[nodiscard]] static auto dispatches_for(const Record &rec,
                                           std::span<const NodeIndex> started)
      -> std::vector<StepDispatch>;
  static auto finalize(Record &rec, ExecutionStatus status, std::string error,
                       TimePoint now) -> void;
  // Applies one step result and advances the run; shared by complete/fail.
  template <typename Fn>
  [[nodiscard]] auto apply_step_result(const TenantId &tenant,
                                       const ExecutionId &id,
                                       std::string_view step, Fn &&fn)
      -> Result<std::vector<StepDispatch>>;

  auto release_slot(const PipelineId &pipeline, const ExecutionId &id) -> void;
  auto record_stats(const PipelineExecution &exec) -> void;
  auto emit(Transition transition) -> void;

  const Clock &clock_;
  PipelineExecutorOptions options_;
  util::ShardedMap<PipelineId, Slot> pipelines_;
  util::ShardedMap<NameKey, PipelineId, NameKeyHash> names_;
  util::ShardedMap<ExecutionId, Record> executions_;
  util::ShardedMap<PipelineId, StatsState> stats_;
  PipelineCallbacks callbacks_;
};

} // namespace conductor
