#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/task/task.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/sharded_map.hpp"

#include <ankerl/unordered_dense.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

// Hooks run by the manager after the transition that triggered them has been
// committed and every lock released.
struct HierarchyCallbacks {
  std::move_only_function<void(const TenantId &tenant, const Task &task,
                               const StatusChange &change)>
      on_status_changed;
  std::move_only_function<void(const TenantId &tenant, const TaskId &task)>
      on_task_removed;
  // Parent chain longer than the depth ceiling: the stored links are corrupt.
  std::move_only_function<void(const TenantId &tenant, const TaskId &task)>
      on_corruption;
};

// Owns the task table of every tenant together with the materialized
// ancestor closure. A tenant's forest is the unit of locking: reparenting
// rewrites closures of whole subtrees and must see a stable tree.
class TaskHierarchyManager {
public:
  explicit TaskHierarchyManager(const Clock &clock = system_clock(),
                                std::size_t shards = defaults::kShardCount);

  TaskHierarchyManager(const TaskHierarchyManager &) = delete;
  auto operator=(const TaskHierarchyManager &)
      -> TaskHierarchyManager & = delete;

  auto set_callbacks(HierarchyCallbacks callbacks) -> void;

  [[nodiscard]] auto create_task(const TenantId &tenant, NewTask spec)
      -> Result<TaskId>;
  [[nodiscard]] auto get_task(const TenantId &tenant, const TaskId &id) const
      -> Result<Task>;
  [[nodiscard]] auto find_by_external_ref(const TenantId &tenant,
                                          std::string_view ref) const
      -> Result<Task>;
  [[nodiscard]] auto task_count(const TenantId &tenant) const -> std::size_t;

  // nullopt detaches the task and makes it a root.
  [[nodiscard]] auto set_parent(const TenantId &tenant, const TaskId &id,
                                const std::optional<TaskId> &new_parent)
      -> Result<void>;

  // Recomputes the stored closure of one task from its parent chain.
  [[nodiscard]] auto rebuild(const TenantId &tenant, const TaskId &id)
      -> Result<std::vector<HierarchyEdge>>;

  [[nodiscard]] auto ancestors(const TenantId &tenant, const TaskId &id) const
      -> Result<std::vector<HierarchyEdge>>;
  [[nodiscard]] auto descendants(const TenantId &tenant, const TaskId &id) const
      -> Result<std::vector<TaskId>>;
  [[nodiscard]] auto children(const TenantId &tenant, const TaskId &id) const
      -> Result<std::vector<TaskId>>;

  [[nodiscard]] auto update_status(const TenantId &tenant, const TaskId &id,
                                   TaskStatus status,
                                   std::string_view changed_by = {},
                                   std::string_view reason = {})
      -> Result<void>;
  [[nodiscard]] auto set_progress(const TenantId &tenant, const TaskId &id,
                                  int progress) -> Result<void>;
  [[nodiscard]] auto update_details(const TenantId &tenant, const TaskId &id,
                                    std::optional<std::string> title,
                                    std::optional<TaskPriority> priority)
      -> Result<void>;
  [[nodiscard]] auto status_history(const TenantId &tenant,
                                    const TaskId &id) const
      -> Result<std::vector<StatusChange>>;

  // Fails with HasDependents while the task still has children.
  [[nodiscard]] auto remove_task(const TenantId &tenant, const TaskId &id)
      -> Result<void>;

  // Recomputes progress of every ancestor of `id` as the mean of its
  // non-cancelled children, nearest parent first.
  auto propagate_progress(const TenantId &tenant, const TaskId &id) -> void;

private:
  struct TaskRecord {
    Task task;
    std::vector<HierarchyEdge> closure;
    std::vector<TaskId> children;
    std::vector<StatusChange> history;
  };

  struct Forest {
    ankerl::unordered_dense::map<TaskId, TaskRecord> tasks;
    ankerl::unordered_dense::map<std::string, TaskId> by_external_ref;
  };

  [[nodiscard]] static auto
  walk_ancestors(const Forest &forest, const TaskId &id,
                 const TaskId &override_task,
                 const std::optional<TaskId> &override_parent)
      -> Result<std::vector<HierarchyEdge>>;
  [[nodiscard]] static auto collect_descendants(const Forest &forest,
                                                const TaskId &id)
      -> std::vector<TaskId>;
  [[nodiscard]] auto reparent_locked(Forest &forest, const TaskId &id,
                                     const std::optional<TaskId> &new_parent)
      -> Result<void>;

  auto report_corruption(const TenantId &tenant, const TaskId &id) -> void;

  const Clock &clock_;
  util::ShardedMap<TenantId, Forest> forests_;
  HierarchyCallbacks callbacks_;
};

} // namespace conductor
