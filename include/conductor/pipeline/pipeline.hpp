#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/util/enum.hpp"
#include "conductor/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

enum class ExecutionStatus : std::uint8_t {
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled,
  Timeout,
};
BOOST_DESCRIBE_ENUM(ExecutionStatus, Queued, Running, Completed, Failed,
                    Cancelled, Timeout)
CONDUCTOR_DEFINE_ENUM_SERDE(ExecutionStatus, ExecutionStatus::Queued)

enum class StepStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Skipped,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(StepStatus, Pending, Running, Completed, Failed, Skipped,
                    Cancelled)
CONDUCTOR_DEFINE_ENUM_SERDE(StepStatus, StepStatus::Pending)

enum class StepType : std::uint8_t { Command, Agent, Webhook, Condition };
BOOST_DESCRIBE_ENUM(StepType, Command, Agent, Webhook, Condition)
CONDUCTOR_DEFINE_ENUM_SERDE(StepType, StepType::Command)

[[nodiscard]] constexpr auto is_terminal(ExecutionStatus s) noexcept -> bool {
  return s != ExecutionStatus::Queued && s != ExecutionStatus::Running;
}

[[nodiscard]] constexpr auto is_terminal(StepStatus s) noexcept -> bool {
  return s != StepStatus::Pending && s != StepStatus::Running;
}

struct StepTemplate {
  std::string name;
  StepType type{StepType::Command};
  std::vector<std::string> depends_on;
  int max_retries{defaults::kStepMaxRetries};
  // Command line, webhook URL or condition expression, depending on type.
  std::string command;

  // Agent steps
  std::string agent_type;
  std::string prompt;
  std::vector<std::string> capabilities;
  int priority{defaults::kAgentTaskPriority};
};

struct PipelineDefinition {
  PipelineId id;
  TenantId tenant;
  std::string name;
  std::string description;
  std::vector<StepTemplate> steps;
  // Event types that start this pipeline when ingested.
  std::vector<std::string> trigger_events;
  bool active{true};
  int max_concurrent_executions{defaults::kPipelineConcurrency};
  std::chrono::seconds timeout{defaults::kPipelineTimeout};
  int version{1};
  TimePoint created_at;
  TimePoint updated_at;
};

struct PipelineStats {
  // Percentage of completed executions among terminal ones in the window.
  double success_rate{0.0};
  std::chrono::milliseconds average_duration{0};
  std::int64_t execution_count{0};
  std::int64_t success_count{0};
  std::int64_t failure_count{0};
  std::optional<TimePoint> last_executed_at;
};

struct PipelineStep {
  StepId id;
  std::string name;
  int order{0};
  StepType type{StepType::Command};
  std::vector<std::string> depends_on;
  StepStatus status{StepStatus::Pending};
  int retry_count{0};
  int max_retries{0};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::string output;
  std::string error;
};

struct PipelineExecution {
  ExecutionId id;
  PipelineId pipeline;
  TenantId tenant;
  std::optional<TaskId> task;
  std::string trigger_event;
  std::string trigger_data;
  ExecutionStatus status{ExecutionStatus::Queued};
  TimePoint created_at;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::optional<std::chrono::milliseconds> duration;
  std::string error;
  std::vector<PipelineStep> steps;

  [[nodiscard]] auto find_step(std::string_view name) const
      -> const PipelineStep * {
    for (const auto &s : steps) {
      if (s.name == name) {
        return &s;
      }
    }
    return nullptr;
  }
};

struct TriggerRequest {
  std::string trigger_event{"manual"};
  // Opaque JSON text carried from the triggering event.
  std::string trigger_data;
  std::optional<TaskId> task;
};

// A step that has just moved to running and must be carried out by someone.
struct StepDispatch {
  TenantId tenant;
  PipelineId pipeline;
  ExecutionId execution;
  StepId step;
  StepTemplate spec;
  int attempt{1};
  std::optional<TaskId> task;
};

} // namespace conductor
