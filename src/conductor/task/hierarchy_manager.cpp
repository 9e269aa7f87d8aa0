#include "conductor/task/hierarchy_manager.hpp"

#include "conductor/util/log.hpp"

#include <algorithm>
#include <utility>

namespace conductor {
namespace {

// Walks from `first` to the root, resetting each non-retired ancestor's
// progress to the rounded mean of its non-cancelled children. Stops at the
// first ancestor whose value does not change.
template <typename Forest>
auto recompute_chain(Forest &forest, std::optional<TaskId> first, TimePoint now)
    -> void {
  auto cur = std::move(first);
  int hops = 0;
  while (cur && hops++ <= limits::kMaxHierarchyDepth) {
    auto it = forest.tasks.find(*cur);
    if (it == forest.tasks.end()) {
      return;
    }
    auto &parent = it->second;
    if (parent.task.status == TaskStatus::Done) {
      return;
    }

    int sum = 0;
    int count = 0;
    for (const auto &child_id : parent.children) {
      auto cit = forest.tasks.find(child_id);
      if (cit == forest.tasks.end() ||
          cit->second.task.status == TaskStatus::Cancelled) {
        continue;
      }
      sum += cit->second.task.progress;
      ++count;
    }
    if (count == 0) {
      return;
    }

    const int mean = (sum + count / 2) / count;
    if (mean == parent.task.progress) {
      return;
    }
    parent.task.progress = mean;
    parent.task.updated_at = now;
    cur = parent.task.parent;
  }
}

} // namespace

TaskHierarchyManager::TaskHierarchyManager(const Clock &clock,
                                           std::size_t shards)
    : clock_(clock), forests_(shards) {}

auto TaskHierarchyManager::set_callbacks(HierarchyCallbacks callbacks) -> void {
  callbacks_ = std::move(callbacks);
}

auto TaskHierarchyManager::walk_ancestors(
    const Forest &forest, const TaskId &id, const TaskId &override_task,
    const std::optional<TaskId> &override_parent)
    -> Result<std::vector<HierarchyEdge>> {
  auto parent_of = [&](const TaskId &t) -> std::optional<TaskId> {
    if (t == override_task) {
      return override_parent;
    }
    auto it = forest.tasks.find(t);
    if (it == forest.tasks.end()) {
      return std::nullopt;
    }
    return it->second.task.parent;
  };

  std::vector<HierarchyEdge> edges;
  auto cur = parent_of(id);
  int depth = 0;
  while (cur) {
    if (depth > limits::kMaxHierarchyDepth) {
      return fail(Error::HierarchyTooDeep);
    }
    edges.push_back(HierarchyEdge{.task = id, .ancestor = *cur, .depth = depth});
    cur = parent_of(*cur);
    ++depth;
  }
  return ok(std::move(edges));
}

auto TaskHierarchyManager::collect_descendants(const Forest &forest,
                                               const TaskId &id)
    -> std::vector<TaskId> {
  std::vector<TaskId> out;
  ankerl::unordered_dense::set<TaskId> seen;
  seen.insert(id);

  auto push_children = [&](const TaskId &t) {
    auto it = forest.tasks.find(t);
    if (it == forest.tasks.end()) {
      return;
    }
    for (const auto &child : it->second.children) {
      if (seen.insert(child).second) {
        out.push_back(child);
      }
    }
  };

  push_children(id);
  for (std::size_t head = 0; head < out.size(); ++head) {
    push_children(out[head]);
  }
  return out;
}

auto TaskHierarchyManager::reparent_locked(
    Forest &forest, const TaskId &id, const std::optional<TaskId> &new_parent)
    -> Result<void> {
  auto it = forest.tasks.find(id);
  if (it == forest.tasks.end()) {
    return fail(Error::NotFound);
  }

  if (new_parent) {
    if (*new_parent == id) {
      return fail(Error::CircularHierarchy);
    }
    if (!forest.tasks.contains(*new_parent)) {
      return fail(Error::NotFound);
    }
    std::optional<TaskId> cur = new_parent;
    int hops = 0;
    while (cur) {
      if (*cur == id) {
        return fail(Error::CircularHierarchy);
      }
      if (++hops > limits::kMaxHierarchyDepth + 1) {
        return fail(Error::HierarchyTooDeep);
      }
      auto pit = forest.tasks.find(*cur);
      cur = pit == forest.tasks.end() ? std::nullopt : pit->second.task.parent;
    }
  }

  // Stage every closure first; nothing is written unless all of them fit
  // under the depth ceiling.
  std::vector<std::pair<TaskId, std::vector<HierarchyEdge>>> staged;
  auto own = walk_ancestors(forest, id, id, new_parent);
  if (!own) {
    return fail(own.error());
  }
  staged.emplace_back(id, std::move(*own));

  for (const auto &desc : collect_descendants(forest, id)) {
    auto closure = walk_ancestors(forest, desc, id, new_parent);
    if (!closure) {
      return fail(closure.error());
    }
    staged.emplace_back(desc, std::move(*closure));
  }

  const auto old_parent = it->second.task.parent;
  if (old_parent) {
    if (auto oit = forest.tasks.find(*old_parent); oit != forest.tasks.end()) {
      std::erase(oit->second.children, id);
    }
  }
  if (new_parent) {
    forest.tasks.find(*new_parent)->second.children.push_back(id);
  }
  it->second.task.parent = new_parent;
  it->second.task.updated_at = clock_.now();

  for (auto &[task_id, closure] : staged) {
    forest.tasks.find(task_id)->second.closure = std::move(closure);
  }
  log::debug("Task {} moved under {} ({} closures rebuilt)", id,
             new_parent ? new_parent->value() : std::string_view{"<root>"},
             staged.size());
  return ok();
}

auto TaskHierarchyManager::report_corruption(const TenantId &tenant,
                                             const TaskId &id) -> void {
  log::critical("Task hierarchy for {} in tenant {} exceeds depth {}; parent "
                "links are likely corrupt",
                id, tenant, limits::kMaxHierarchyDepth);
  if (callbacks_.on_corruption) {
    callbacks_.on_corruption(tenant, id);
  }
}

auto TaskHierarchyManager::create_task(const TenantId &tenant, NewTask spec)
    -> Result<TaskId> {
  if (spec.title.empty() || has_control_chars(spec.title)) {
    return fail(Error::InvalidArgument);
  }

  auto id = generate_id<TaskId>("task");
  const auto now = clock_.now();

  auto res = forests_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto &forest = map[tenant];
    if (!spec.external_ref.empty() &&
        forest.by_external_ref.contains(spec.external_ref)) {
      return fail(Error::AlreadyExists);
    }
    if (spec.parent && !forest.tasks.contains(*spec.parent)) {
      return fail(Error::NotFound);
    }

    TaskRecord record;
    record.task = Task{.id = id,
                       .tenant = tenant,
                       .parent = std::nullopt,
                       .title = std::move(spec.title),
                       .description = std::move(spec.description),
                       .status = spec.status,
                       .priority = spec.priority,
                       .progress = 0,
                       .external_ref = spec.external_ref,
                       .created_at = now,
                       .updated_at = now,
                       .started_at = std::nullopt,
                       .completed_at = std::nullopt};
    if (spec.status == TaskStatus::InProgress) {
      record.task.started_at = now;
    } else if (spec.status == TaskStatus::Done) {
      record.task.completed_at = now;
      record.task.progress = limits::kMaxProgress;
    }
    forest.tasks.emplace(id, std::move(record));

    if (spec.parent) {
      if (auto r = reparent_locked(forest, id, spec.parent); !r) {
        forest.tasks.erase(id);
        return fail(r.error());
      }
    }
    if (!spec.external_ref.empty()) {
      forest.by_external_ref.emplace(spec.external_ref, id);
    }
    return ok();
  });

  if (!res) {
    if (res.error() == make_error_code(Error::HierarchyTooDeep) &&
        spec.parent) {
      report_corruption(tenant, *spec.parent);
    }
    return fail(res.error());
  }

  log::debug("Created task {} in tenant {}", id, tenant);
  if (spec.parent) {
    propagate_progress(tenant, id);
  }
  return ok(std::move(id));
}

auto TaskHierarchyManager::get_task(const TenantId &tenant,
                                    const TaskId &id) const -> Result<Task> {
  return forests_.with_shard(tenant, [&](const auto &map) -> Result<Task> {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return fail(Error::NotFound);
    }
    auto it = fit->second.tasks.find(id);
    if (it == fit->second.tasks.end()) {
      return fail(Error::NotFound);
    }
    return ok(it->second.task);
  });
}

auto TaskHierarchyManager::find_by_external_ref(const TenantId &tenant,
                                                std::string_view ref) const
    -> Result<Task> {
  return forests_.with_shard(tenant, [&](const auto &map) -> Result<Task> {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return fail(Error::NotFound);
    }
    const auto &forest = fit->second;
    auto rit = forest.by_external_ref.find(std::string(ref));
    if (rit == forest.by_external_ref.end()) {
      return fail(Error::NotFound);
    }
    auto it = forest.tasks.find(rit->second);
    if (it == forest.tasks.end()) {
      return fail(Error::NotFound);
    }
    return ok(it->second.task);
  });
}

auto TaskHierarchyManager::task_count(const TenantId &tenant) const
    -> std::size_t {
  return forests_.with_shard(tenant, [&](const auto &map) -> std::size_t {
    auto fit = map.find(tenant);
    return fit == map.end() ? 0 : fit->second.tasks.size();
  });
}

auto TaskHierarchyManager::set_parent(const TenantId &tenant, const TaskId &id,
                                      const std::optional<TaskId> &new_parent)
    -> Result<void> {
  std::optional<TaskId> old_parent;
  auto res = forests_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return fail(Error::NotFound);
    }
    auto it = fit->second.tasks.find(id);
    if (it == fit->second.tasks.end()) {
      return fail(Error::NotFound);
    }
    old_parent = it->second.task.parent;
    return reparent_locked(fit->second, id, new_parent);
  });

  if (!res) {
    if (res.error() == make_error_code(Error::HierarchyTooDeep)) {
      report_corruption(tenant, id);
    } else {
      log::warn("Rejected parent change for task {}: {}", id,
                res.error().message());
    }
    return res;
  }

  const auto now = clock_.now();
  forests_.with_shard(tenant, [&](auto &map) {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return;
    }
    recompute_chain(fit->second, old_parent, now);
    recompute_chain(fit->second, new_parent, now);
  });
  return ok();
}

auto TaskHierarchyManager::rebuild(const TenantId &tenant, const TaskId &id)
    -> Result<std::vector<HierarchyEdge>> {
  auto res = forests_.with_shard(
      tenant, [&](auto &map) -> Result<std::vector<HierarchyEdge>> {
        auto fit = map.find(tenant);
        if (fit == map.end()) {
          return fail(Error::NotFound);
        }
        auto &forest = fit->second;
        auto it = forest.tasks.find(id);
        if (it == forest.tasks.end()) {
          return fail(Error::NotFound);
        }
        auto closure = walk_ancestors(forest, id, id, it->second.task.parent);
        if (!closure) {
          return fail(closure.error());
        }
        it->second.closure = *closure;
        return closure;
      });
  if (!res && res.error() == make_error_code(Error::HierarchyTooDeep)) {
    report_corruption(tenant, id);
  }
  return res;
}

auto TaskHierarchyManager::ancestors(const TenantId &tenant,
                                     const TaskId &id) const
    -> Result<std::vector<HierarchyEdge>> {
  return forests_.with_shard(
      tenant, [&](const auto &map) -> Result<std::vector<HierarchyEdge>> {
        auto fit = map.find(tenant);
        if (fit == map.end()) {
          return fail(Error::NotFound);
        }
        auto it = fit->second.tasks.find(id);
        if (it == fit->second.tasks.end()) {
          return fail(Error::NotFound);
        }
        return ok(it->second.closure);
      });
}

auto TaskHierarchyManager::descendants(const TenantId &tenant,
                                       const TaskId &id) const
    -> Result<std::vector<TaskId>> {
  return forests_.with_shard(
      tenant, [&](const auto &map) -> Result<std::vector<TaskId>> {
        auto fit = map.find(tenant);
        if (fit == map.end() || !fit->second.tasks.contains(id)) {
          return fail(Error::NotFound);
        }
        return ok(collect_descendants(fit->second, id));
      });
}

auto TaskHierarchyManager::children(const TenantId &tenant,
                                    const TaskId &id) const
    -> Result<std::vector<TaskId>> {
  return forests_.with_shard(
      tenant, [&](const auto &map) -> Result<std::vector<TaskId>> {
        auto fit = map.find(tenant);
        if (fit == map.end()) {
          return fail(Error::NotFound);
        }
        auto it = fit->second.tasks.find(id);
        if (it == fit->second.tasks.end()) {
          return fail(Error::NotFound);
        }
        return ok(it->second.children);
      });
}

auto TaskHierarchyManager::update_status(const TenantId &tenant,
                                         const TaskId &id, TaskStatus status,
                                         std::string_view changed_by,
                                         std::string_view reason)
    -> Result<void> {
  const auto now = clock_.now();
  std::optional<std::pair<Task, StatusChange>> fired;

  auto res = forests_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return fail(Error::NotFound);
    }
    auto it = fit->second.tasks.find(id);
    if (it == fit->second.tasks.end()) {
      return fail(Error::NotFound);
    }
    auto &record = it->second;
    const auto previous = record.task.status;
    if (previous == status) {
      return ok();
    }

    record.task.status = status;
    record.task.updated_at = now;
    if (status == TaskStatus::InProgress && !record.task.started_at) {
      record.task.started_at = now;
    }
    if (status == TaskStatus::Done) {
      record.task.completed_at = now;
      record.task.progress = limits::kMaxProgress;
    } else if (previous == TaskStatus::Done) {
      record.task.completed_at.reset();
    }

    StatusChange change{.task = id,
                        .from = previous,
                        .to = status,
                        .changed_by = std::string(changed_by),
                        .reason = std::string(reason),
                        .at = now};
    record.history.push_back(change);
    fired.emplace(record.task, std::move(change));
    return ok();
  });
  if (!res) {
    return res;
  }

  if (fired) {
    log::debug("Task {} status {} -> {}", id, to_string_view(fired->second.from),
               to_string_view(fired->second.to));
    if (callbacks_.on_status_changed) {
      callbacks_.on_status_changed(tenant, fired->first, fired->second);
    }
    propagate_progress(tenant, id);
  }
  return ok();
}

auto TaskHierarchyManager::set_progress(const TenantId &tenant,
                                        const TaskId &id, int progress)
    -> Result<void> {
  if (progress < 0 || progress > limits::kMaxProgress) {
    return fail(Error::InvalidArgument);
  }
  auto res = forests_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return fail(Error::NotFound);
    }
    auto it = fit->second.tasks.find(id);
    if (it == fit->second.tasks.end()) {
      return fail(Error::NotFound);
    }
    it->second.task.progress = progress;
    it->second.task.updated_at = clock_.now();
    return ok();
  });
  if (!res) {
    return res;
  }
  propagate_progress(tenant, id);
  return ok();
}

auto TaskHierarchyManager::update_details(const TenantId &tenant,
                                          const TaskId &id,
                                          std::optional<std::string> title,
                                          std::optional<TaskPriority> priority)
    -> Result<void> {
  if (title && (title->empty() || has_control_chars(*title))) {
    return fail(Error::InvalidArgument);
  }
  return forests_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return fail(Error::NotFound);
    }
    auto it = fit->second.tasks.find(id);
    if (it == fit->second.tasks.end()) {
      return fail(Error::NotFound);
    }
    if (title) {
      it->second.task.title = std::move(*title);
    }
    if (priority) {
      it->second.task.priority = *priority;
    }
    it->second.task.updated_at = clock_.now();
    return ok();
  });
}

auto TaskHierarchyManager::status_history(const TenantId &tenant,
                                          const TaskId &id) const
    -> Result<std::vector<StatusChange>> {
  return forests_.with_shard(
      tenant, [&](const auto &map) -> Result<std::vector<StatusChange>> {
        auto fit = map.find(tenant);
        if (fit == map.end()) {
          return fail(Error::NotFound);
        }
        auto it = fit->second.tasks.find(id);
        if (it == fit->second.tasks.end()) {
          return fail(Error::NotFound);
        }
        return ok(it->second.history);
      });
}

auto TaskHierarchyManager::remove_task(const TenantId &tenant,
                                       const TaskId &id) -> Result<void> {
  std::optional<TaskId> parent;
  auto res = forests_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return fail(Error::NotFound);
    }
    auto &forest = fit->second;
    auto it = forest.tasks.find(id);
    if (it == forest.tasks.end()) {
      return fail(Error::NotFound);
    }
    if (!it->second.children.empty()) {
      return fail(Error::HasDependents);
    }
    parent = it->second.task.parent;
    if (parent) {
      if (auto pit = forest.tasks.find(*parent); pit != forest.tasks.end()) {
        std::erase(pit->second.children, id);
      }
    }
    if (!it->second.task.external_ref.empty()) {
      forest.by_external_ref.erase(it->second.task.external_ref);
    }
    forest.tasks.erase(it);
    return ok();
  });
  if (!res) {
    return res;
  }

  log::debug("Removed task {} from tenant {}", id, tenant);
  if (callbacks_.on_task_removed) {
    callbacks_.on_task_removed(tenant, id);
  }
  if (parent) {
    const auto now = clock_.now();
    forests_.with_shard(tenant, [&](auto &map) {
      if (auto fit = map.find(tenant); fit != map.end()) {
        recompute_chain(fit->second, parent, now);
      }
    });
  }
  return ok();
}

auto TaskHierarchyManager::propagate_progress(const TenantId &tenant,
                                              const TaskId &id) -> void {
  const auto now = clock_.now();
  forests_.with_shard(tenant, [&](auto &map) {
    auto fit = map.find(tenant);
    if (fit == map.end()) {
      return;
    }
    auto it = fit->second.tasks.find(id);
    if (it == fit->second.tasks.end()) {
      return;
    }
    recompute_chain(fit->second, it->second.task.parent, now);
  });
}

} // namespace conductor
