#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/task/task.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/sharded_map.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <functional>
#include <vector>

namespace conductor {

// Directed "depends on" edges between tasks of one tenant. Insertion runs
// the cycle check and the write under the tenant graph lock.
class DependencyGraph {
public:
  using TaskExistsFn =
      std::function<bool(const TenantId &tenant, const TaskId &task)>;

  explicit DependencyGraph(const Clock &clock = system_clock(),
                           std::size_t shards = defaults::kShardCount);

  DependencyGraph(const DependencyGraph &) = delete;
  auto operator=(const DependencyGraph &) -> DependencyGraph & = delete;

  // When set, both endpoints must exist before an edge is accepted.
  auto set_task_exists(TaskExistsFn fn) -> void;

  [[nodiscard]] auto add_dependency(const TenantId &tenant,
                                    const TaskId &dependent,
                                    const TaskId &dependency,
                                    DependencyType type = DependencyType::Blocks)
      -> Result<void>;
  [[nodiscard]] auto remove_dependency(const TenantId &tenant,
                                       const TaskId &dependent,
                                       const TaskId &dependency)
      -> Result<void>;
  // Drops every edge touching `task`; returns how many were removed.
  auto remove_task(const TenantId &tenant, const TaskId &task) -> std::size_t;

  // Read-only form of the insertion check. Error::DependencyTooDeep when the
  // answer cannot be established within the depth ceiling.
  [[nodiscard]] auto would_create_cycle(const TenantId &tenant,
                                        const TaskId &dependent,
                                        const TaskId &dependency) const
      -> Result<bool>;

  [[nodiscard]] auto dependencies_of(const TenantId &tenant,
                                     const TaskId &task) const
      -> std::vector<DependencyEdge>;
  [[nodiscard]] auto dependents_of(const TenantId &tenant,
                                   const TaskId &task) const
      -> std::vector<DependencyEdge>;
  // Dependencies of type `blocks` only.
  [[nodiscard]] auto blockers_of(const TenantId &tenant,
                                 const TaskId &task) const
      -> std::vector<TaskId>;
  [[nodiscard]] auto edges(const TenantId &tenant) const
      -> std::vector<DependencyEdge>;
  [[nodiscard]] auto edge_count(const TenantId &tenant) const -> std::size_t;

private:
  struct Graph {
    // dependent -> edges it owns
    ankerl::unordered_dense::map<TaskId, std::vector<DependencyEdge>> out;
    // dependency -> dependents
    ankerl::unordered_dense::map<TaskId, std::vector<TaskId>> in;
    std::size_t edge_count{0};
  };

  [[nodiscard]] static auto reaches(const Graph &graph, const TaskId &from,
                                    const TaskId &target) -> Result<bool>;

  const Clock &clock_;
  util::ShardedMap<TenantId, Graph> graphs_;
  TaskExistsFn task_exists_;
};

} // namespace conductor
