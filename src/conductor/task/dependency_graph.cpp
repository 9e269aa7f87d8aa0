#include "conductor/task/dependency_graph.hpp"

#include "conductor/util/log.hpp"

#include <algorithm>
#include <utility>

namespace conductor {

DependencyGraph::DependencyGraph(const Clock &clock, std::size_t shards)
    : clock_(clock), graphs_(shards) {}

auto DependencyGraph::set_task_exists(TaskExistsFn fn) -> void {
  task_exists_ = std::move(fn);
}

// Level-by-level walk of "depends on" edges starting at `from`. Each node is
// expanded once, so the cost is linear in the number of edges visited.
auto DependencyGraph::reaches(const Graph &graph, const TaskId &from,
                              const TaskId &target) -> Result<bool> {
  ankerl::unordered_dense::set<TaskId> visited;
  visited.insert(from);
  std::vector<TaskId> frontier{from};
  std::vector<TaskId> next;

  for (int depth = 0; !frontier.empty(); ++depth) {
    if (depth >= limits::kMaxDependencyDepth) {
      return fail(Error::DependencyTooDeep);
    }
    next.clear();
    for (const auto &node : frontier) {
      auto it = graph.out.find(node);
      if (it == graph.out.end()) {
        continue;
      }
      for (const auto &edge : it->second) {
        if (edge.dependency == target) {
          return ok(true);
        }
        if (visited.insert(edge.dependency).second) {
          next.push_back(edge.dependency);
        }
      }
    }
    frontier.swap(next);
  }
  return ok(false);
}

auto DependencyGraph::add_dependency(const TenantId &tenant,
                                     const TaskId &dependent,
                                     const TaskId &dependency,
                                     DependencyType type) -> Result<void> {
  if (dependent.empty() || dependency.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (dependent == dependency) {
    return fail(Error::CircularDependency);
  }
  if (task_exists_ &&
      (!task_exists_(tenant, dependent) || !task_exists_(tenant, dependency))) {
    return fail(Error::NotFound);
  }

  const auto now = clock_.now();
  auto res = graphs_.with_shard(tenant, [&](auto &map) -> Result<void> {
    // Checked again under the graph lock: a task deleted after the first
    // check has its edges dropped through a callback that needs this lock,
    // so it either fails here or finds the edge to drop. The hierarchy
    // releases its own lock before that callback runs.
    if (task_exists_ &&
        (!task_exists_(tenant, dependent) || !task_exists_(tenant, dependency))) {
      return fail(Error::NotFound);
    }
    auto &graph = map[tenant];

    if (auto it = graph.out.find(dependent); it != graph.out.end()) {
      const bool duplicate =
          std::ranges::any_of(it->second, [&](const DependencyEdge &e) {
            return e.dependency == dependency;
          });
      if (duplicate) {
        return fail(Error::AlreadyExists);
      }
    }

    auto cyclic = reaches(graph, dependency, dependent);
    if (!cyclic) {
      return fail(cyclic.error());
    }
    if (*cyclic) {
      return fail(Error::CircularDependency);
    }

    graph.out[dependent].push_back(DependencyEdge{.dependent = dependent,
                                                  .dependency = dependency,
                                                  .type = type,
                                                  .created_at = now});
    graph.in[dependency].push_back(dependent);
    ++graph.edge_count;
    return ok();
  });

  if (!res) {
    log::warn("Rejected dependency {} -> {} in tenant {}: {}", dependent,
              dependency, tenant, res.error().message());
    return res;
  }
  log::debug("Task {} now depends on {} ({})", dependent, dependency,
             to_string_view(type));
  return ok();
}

auto DependencyGraph::remove_dependency(const TenantId &tenant,
                                        const TaskId &dependent,
                                        const TaskId &dependency)
    -> Result<void> {
  return graphs_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto git = map.find(tenant);
    if (git == map.end()) {
      return fail(Error::NotFound);
    }
    auto &graph = git->second;
    auto it = graph.out.find(dependent);
    if (it == graph.out.end()) {
      return fail(Error::NotFound);
    }
    const auto removed = std::erase_if(it->second, [&](const DependencyEdge &e) {
      return e.dependency == dependency;
    });
    if (removed == 0) {
      return fail(Error::NotFound);
    }
    if (it->second.empty()) {
      graph.out.erase(it);
    }
    if (auto in_it = graph.in.find(dependency); in_it != graph.in.end()) {
      std::erase(in_it->second, dependent);
      if (in_it->second.empty()) {
        graph.in.erase(in_it);
      }
    }
    graph.edge_count -= removed;
    return ok();
  });
}

auto DependencyGraph::remove_task(const TenantId &tenant, const TaskId &task)
    -> std::size_t {
  return graphs_.with_shard(tenant, [&](auto &map) -> std::size_t {
    auto git = map.find(tenant);
    if (git == map.end()) {
      return 0;
    }
    auto &graph = git->second;
    std::size_t removed = 0;

    // Edges where `task` is the dependent.
    if (auto it = graph.out.find(task); it != graph.out.end()) {
      for (const auto &edge : it->second) {
        if (auto in_it = graph.in.find(edge.dependency);
            in_it != graph.in.end()) {
          std::erase(in_it->second, task);
          if (in_it->second.empty()) {
            graph.in.erase(in_it);
          }
        }
      }
      removed += it->second.size();
      graph.out.erase(it);
    }

    // Edges where `task` is the dependency.
    if (auto in_it = graph.in.find(task); in_it != graph.in.end()) {
      for (const auto &dependent : in_it->second) {
        if (auto it = graph.out.find(dependent); it != graph.out.end()) {
          removed += std::erase_if(it->second, [&](const DependencyEdge &e) {
            return e.dependency == task;
          });
          if (it->second.empty()) {
            graph.out.erase(it);
          }
        }
      }
      graph.in.erase(in_it);
    }

    graph.edge_count -= removed;
    return removed;
  });
}

auto DependencyGraph::would_create_cycle(const TenantId &tenant,
                                         const TaskId &dependent,
                                         const TaskId &dependency) const
    -> Result<bool> {
  if (dependent == dependency) {
    return ok(true);
  }
  return graphs_.with_shard(tenant, [&](const auto &map) -> Result<bool> {
    auto git = map.find(tenant);
    if (git == map.end()) {
      return ok(false);
    }
    return reaches(git->second, dependency, dependent);
  });
}

auto DependencyGraph::dependencies_of(const TenantId &tenant,
                                      const TaskId &task) const
    -> std::vector<DependencyEdge> {
  return graphs_.with_shard(
      tenant, [&](const auto &map) -> std::vector<DependencyEdge> {
        auto git = map.find(tenant);
        if (git == map.end()) {
          return {};
        }
        auto it = git->second.out.find(task);
        if (it == git->second.out.end()) {
          return {};
        }
        return it->second;
      });
}

auto DependencyGraph::dependents_of(const TenantId &tenant,
                                    const TaskId &task) const
    -> std::vector<DependencyEdge> {
  return graphs_.with_shard(
      tenant, [&](const auto &map) -> std::vector<DependencyEdge> {
        auto git = map.find(tenant);
        if (git == map.end()) {
          return {};
        }
        const auto &graph = git->second;
        auto in_it = graph.in.find(task);
        if (in_it == graph.in.end()) {
          return {};
        }
        std::vector<DependencyEdge> out;
        for (const auto &dependent : in_it->second) {
          auto it = graph.out.find(dependent);
          if (it == graph.out.end()) {
            continue;
          }
          for (const auto &edge : it->second) {
            if (edge.dependency == task) {
              out.push_back(edge);
            }
          }
        }
        return out;
      });
}

auto DependencyGraph::blockers_of(const TenantId &tenant,
                                  const TaskId &task) const
    -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (const auto &edge : dependencies_of(tenant, task)) {
    if (edge.type == DependencyType::Blocks) {
      out.push_back(edge.dependency);
    }
  }
  return out;
}

auto DependencyGraph::edges(const TenantId &tenant) const
    -> std::vector<DependencyEdge> {
  return graphs_.with_shard(
      tenant, [&](const auto &map) -> std::vector<DependencyEdge> {
        std::vector<DependencyEdge> out;
        auto git = map.find(tenant);
        if (git == map.end()) {
          return out;
        }
        out.reserve(git->second.edge_count);
        for (const auto &[dependent, list] : git->second.out) {
          out.insert(out.end(), list.begin(), list.end());
        }
        return out;
      });
}

auto DependencyGraph::edge_count(const TenantId &tenant) const
    -> std::size_t {
  return graphs_.with_shard(tenant, [&](const auto &map) -> std::size_t {
    auto git = map.find(tenant);
    return git == map.end() ? 0 : git->second.edge_count;
  });
}

} // namespace conductor
