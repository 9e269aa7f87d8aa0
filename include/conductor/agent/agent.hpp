#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/util/enum.hpp"
#include "conductor/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

enum class AgentStatus : std::uint8_t {
  Active,
  Inactive,
  Maintenance,
  Deprecated,
};
BOOST_DESCRIBE_ENUM(AgentStatus, Active, Inactive, Maintenance, Deprecated)
CONDUCTOR_DEFINE_ENUM_SERDE(AgentStatus, AgentStatus::Inactive)

enum class AgentTaskStatus : std::uint8_t {
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled,
  Timeout,
};
BOOST_DESCRIBE_ENUM(AgentTaskStatus, Queued, Running, Completed, Failed,
                    Cancelled, Timeout)
CONDUCTOR_DEFINE_ENUM_SERDE(AgentTaskStatus, AgentTaskStatus::Queued)

[[nodiscard]] constexpr auto is_terminal(AgentTaskStatus s) noexcept -> bool {
  return s != AgentTaskStatus::Queued && s != AgentTaskStatus::Running;
}

struct Capability {
  std::string name;
  bool enabled{true};
  std::int64_t usage_count{0};
  std::int64_t success_count{0};
};

struct AgentSpec {
  std::string name;
  std::string type;
  AgentStatus status{AgentStatus::Active};
  std::vector<Capability> capabilities;
  int max_concurrent_tasks{defaults::kAgentMaxConcurrentTasks};
  // 0 selects the scheduler default.
  std::chrono::seconds timeout{0};
};

struct Agent {
  AgentId id;
  TenantId tenant;
  std::string name;
  std::string type;
  AgentStatus status{AgentStatus::Active};
  std::vector<Capability> capabilities;
  int max_concurrent_tasks{defaults::kAgentMaxConcurrentTasks};
  std::chrono::seconds timeout{defaults::kAgentTimeout};

  // Percentage over the trailing statistics window.
  double success_rate{0.0};
  std::chrono::milliseconds average_completion_time{0};
  std::int64_t total_tasks_completed{0};
  std::int64_t total_tokens_used{0};
  std::int64_t total_cost_cents{0};
  std::optional<TimePoint> last_used_at;
  TimePoint created_at;

  [[nodiscard]] auto find_capability(std::string_view cap) const
      -> const Capability * {
    auto it = std::ranges::find(capabilities, cap, &Capability::name);
    return it == capabilities.end() ? nullptr : &*it;
  }

  [[nodiscard]] auto has_enabled(std::string_view cap) const -> bool {
    const auto *c = find_capability(cap);
    return c != nullptr && c->enabled;
  }
};

// Pipeline step an agent task was created for.
struct StepRef {
  ExecutionId execution;
  std::string step;
};

struct AgentTaskRequest {
  std::string task_type;
  std::string prompt;
  // Opaque JSON text handed to the agent runtime.
  std::string context;
  int priority{defaults::kAgentTaskPriority};
  std::optional<int> max_retries;
  std::vector<std::string> required_capabilities;
  std::optional<TaskId> task;
  std::optional<StepRef> step;
};

struct AgentTask {
  AgentTaskId id;
  AgentId agent;
  TenantId tenant;
  std::optional<TaskId> task;
  std::optional<StepRef> step;
  std::string task_type;
  std::string prompt;
  std::string context;
  AgentTaskStatus status{AgentTaskStatus::Queued};
  // 1 is the most urgent.
  int priority{defaults::kAgentTaskPriority};
  int retry_count{0};
  int max_retries{defaults::kAgentTaskMaxRetries};
  std::vector<std::string> required_capabilities;
  std::chrono::seconds timeout{defaults::kAgentTimeout};
  TimePoint created_at;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::optional<std::chrono::milliseconds> duration;
  std::string result;
  std::int64_t tokens_used{0};
  std::int64_t cost_cents{0};
  std::vector<std::string> capabilities_used;
  std::string error_message;
};

} // namespace conductor
