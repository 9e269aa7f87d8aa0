#include "conductor/pipeline/step_graph.hpp"

#include "conductor/core/constants.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace conductor {

auto StepGraph::build(std::span<const StepTemplate> steps,
                      std::string *diagnostic) -> Result<StepGraph> {
  auto report = [&](Error e, std::string msg) -> Result<StepGraph> {
    if (diagnostic != nullptr) {
      *diagnostic = std::move(msg);
    }
    return fail(e);
  };

  StepGraph graph;
  for (const auto &step : steps) {
    if (step.name.empty() || has_control_chars(step.name)) {
      return report(Error::InvalidArgument, "step name must be non-empty");
    }
    if (graph.has_node(step.name)) {
      return report(Error::InvalidArgument,
                    std::format("duplicate step name '{}'", step.name));
    }
    if (auto r = graph.add_node(step.name, step.max_retries); !r) {
      return report(r.error() == make_error_code(Error::ResourceExhausted)
                        ? Error::ResourceExhausted
                        : Error::InvalidArgument,
                    "too many steps");
    }
  }

  for (const auto &step : steps) {
    for (const auto &dep : step.depends_on) {
      if (!graph.has_node(dep)) {
        return report(Error::InvalidArgument,
                      std::format("step '{}' depends on unknown step '{}'",
                                  step.name, dep));
      }
      if (auto r = graph.add_edge(dep, step.name); !r) {
        return report(Error::InvalidArgument,
                      std::format("step '{}' cannot depend on '{}'", step.name,
                                  dep));
      }
    }
  }

  if (auto r = graph.is_valid(); !r) {
    return report(Error::CycleDetected, "step dependencies contain a cycle");
  }
  return ok(std::move(graph));
}

auto StepGraph::add_node(std::string name, int max_retries)
    -> Result<NodeIndex> {
  if (auto it = name_to_idx_.find(name); it != name_to_idx_.end()) {
    return ok(it->second);
  }
  if (nodes_.size() >= limits::kMaxStepsPerPipeline) {
    return fail(Error::ResourceExhausted);
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  name_to_idx_.emplace(name, idx);
  nodes_.push_back(Node{.name = std::move(name),
                        .deps = {},
                        .dependents = {},
                        .max_retries = std::max(max_retries, 0)});
  return ok(idx);
}

auto StepGraph::add_edge(std::string_view from, std::string_view to)
    -> Result<void> {
  NodeIndex from_idx = index_of(from);
  NodeIndex to_idx = index_of(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto StepGraph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size() || from == to) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  auto &deps = nodes_[to].deps;
  if (std::ranges::find(deps, from) != deps.end()) {
    return ok();
  }
  deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

auto StepGraph::has_node(std::string_view name) const -> bool {
  return index_of(name) != kInvalidNode;
}

// Iterative three-colour DFS; a grey child means a back edge.
auto StepGraph::is_valid() const -> Result<void> {
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(nodes_.size());

  for (NodeIndex start = 0; start < nodes_.size(); ++start) {
    if (state[start] != 0) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &next = nodes_[node].dependents;
      if (child_idx < next.size()) {
        NodeIndex child = next[child_idx++];
        if (state[child] == 1) {
          return fail(Error::CycleDetected);
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto StepGraph::topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.push_back(node.deps.size());
  }

  std::vector<NodeIndex> order;
  order.reserve(nodes_.size());
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) {
      order.push_back(i);
    }
  }
  for (std::size_t head = 0; head < order.size(); ++head) {
    for (NodeIndex dep : nodes_[order[head]].dependents) {
      if (--in_degree[dep] == 0) {
        order.push_back(dep);
      }
    }
  }
  return order;
}

auto StepGraph::deps(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto StepGraph::dependents(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto StepGraph::index_of(std::string_view name) const -> NodeIndex {
  auto it = name_to_idx_.find(std::string(name));
  return it != name_to_idx_.end() ? it->second : kInvalidNode;
}

auto StepGraph::name_of(NodeIndex idx) const -> const std::string & {
  static const std::string kEmpty;
  if (idx >= nodes_.size()) {
    return kEmpty;
  }
  return nodes_[idx].name;
}

auto StepGraph::max_retries(NodeIndex idx) const noexcept -> int {
  if (idx >= nodes_.size()) {
    return 0;
  }
  return nodes_[idx].max_retries;
}

} // namespace conductor
