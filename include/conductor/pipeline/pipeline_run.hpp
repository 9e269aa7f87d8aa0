#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/error.hpp"
#include "conductor/pipeline/pipeline.hpp"
#include "conductor/pipeline/step_graph.hpp"

#include <boost/dynamic_bitset.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

struct StepRunInfo {
  StepId id;
  NodeIndex idx{kInvalidNode};
  StepStatus status{StepStatus::Pending};
  int retry_count{0};
  int max_retries{0};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::string output;
  std::string error;
};

// Outcome of a failed attempt.
enum class FailureOutcome : std::uint8_t { Retrying, Failed };

// Per-execution step state. Not thread-safe; the owning executor guards it
// with the execution's shard lock.
class PipelineRun {
public:
  explicit PipelineRun(std::shared_ptr<const StepGraph> graph);

  [[nodiscard]] auto graph() const noexcept -> const StepGraph & {
    return *graph_;
  }

  [[nodiscard]] auto ready_steps() const -> std::vector<NodeIndex>;
  [[nodiscard]] auto ready_count() const noexcept -> std::size_t {
    return ready_mask_.count();
  }
  [[nodiscard]] auto running_count() const noexcept -> std::size_t {
    return running_mask_.count();
  }

  // Moves every ready step to running and returns them.
  auto start_ready(TimePoint now) -> std::vector<NodeIndex>;

  [[nodiscard]] auto mark_completed(NodeIndex idx, std::string output,
                                    TimePoint now) -> Result<void>;
  // A step with retries left returns to pending (and straight to ready,
  // since its dependencies are already satisfied).
  [[nodiscard]] auto mark_failed(NodeIndex idx, std::string error,
                                 TimePoint now) -> Result<FailureOutcome>;
  // Every non-terminal step becomes cancelled.
  auto cancel(TimePoint now) -> void;

  [[nodiscard]] auto is_complete() const noexcept -> bool;
  [[nodiscard]] auto has_failed() const noexcept -> bool {
    return failed_mask_.any();
  }

  [[nodiscard]] auto info(NodeIndex idx) const -> const StepRunInfo &;
  [[nodiscard]] auto find(std::string_view name) const -> NodeIndex {
    return graph_->index_of(name);
  }
  [[nodiscard]] auto steps() const noexcept
      -> const std::vector<StepRunInfo> & {
    return steps_;
  }

private:
  auto set_terminal(NodeIndex idx, StepStatus status, TimePoint now) -> void;
  auto skip_downstream(NodeIndex idx, TimePoint now) -> void;

  std::shared_ptr<const StepGraph> graph_;
  std::vector<StepRunInfo> steps_;
  std::vector<std::size_t> in_degree_;
  std::vector<std::size_t> completed_dep_count_;

  boost::dynamic_bitset<> ready_mask_;
  boost::dynamic_bitset<> running_mask_;
  boost::dynamic_bitset<> terminal_mask_;
  boost::dynamic_bitset<> failed_mask_;
};

} // namespace conductor
