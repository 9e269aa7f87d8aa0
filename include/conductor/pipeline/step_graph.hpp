#pragma once

#include "conductor/core/error.hpp"
#include "conductor/pipeline/pipeline.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Immutable dependency graph of a pipeline's steps, indexed by step order.
class StepGraph {
public:
  // Validates names (non-empty, unique), dependency references and
  // acyclicity. Unknown or duplicate names yield InvalidArgument, cycles
  // CycleDetected.
  [[nodiscard]] static auto build(std::span<const StepTemplate> steps,
                                  std::string *diagnostic = nullptr)
      -> Result<StepGraph>;

  [[nodiscard]] auto add_node(std::string name, int max_retries = 0)
      -> Result<NodeIndex>;
  [[nodiscard]] auto add_edge(std::string_view from, std::string_view to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(std::string_view name) const -> bool;
  [[nodiscard]] auto is_valid() const -> Result<void>;

  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;
  [[nodiscard]] auto deps(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto index_of(std::string_view name) const -> NodeIndex;
  [[nodiscard]] auto name_of(NodeIndex idx) const -> const std::string &;
  [[nodiscard]] auto max_retries(NodeIndex idx) const noexcept -> int;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

private:
  struct Node {
    std::string name;
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
    int max_retries{0};
  };

  std::vector<Node> nodes_;
  ankerl::unordered_dense::map<std::string, NodeIndex> name_to_idx_;
};

} // namespace conductor
