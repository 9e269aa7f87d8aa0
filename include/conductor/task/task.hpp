#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/util/enum.hpp"
#include "conductor/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace conductor {

enum class TaskStatus : std::uint8_t {
  Backlog,
  Todo,
  InProgress,
  InReview,
  Done,
  Cancelled,
  Blocked,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Backlog, Todo, InProgress, InReview, Done,
                    Cancelled, Blocked)
CONDUCTOR_DEFINE_ENUM_SERDE(TaskStatus, TaskStatus::Backlog)

enum class TaskPriority : std::uint8_t { Critical, High, Medium, Low, None };
BOOST_DESCRIBE_ENUM(TaskPriority, Critical, High, Medium, Low, None)
CONDUCTOR_DEFINE_ENUM_SERDE(TaskPriority, TaskPriority::Medium)

enum class DependencyType : std::uint8_t {
  Blocks,
  RelatesTo,
  Duplicates,
  SubtaskOf,
};
BOOST_DESCRIBE_ENUM(DependencyType, Blocks, RelatesTo, Duplicates, SubtaskOf)
CONDUCTOR_DEFINE_ENUM_SERDE(DependencyType, DependencyType::Blocks)

// Done and cancelled tasks are retired; they keep their records but no
// longer take part in parent progress.
[[nodiscard]] constexpr auto is_retired(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Done || s == TaskStatus::Cancelled;
}

struct Task {
  TaskId id;
  TenantId tenant;
  std::optional<TaskId> parent;
  std::string title;
  std::string description;
  TaskStatus status{TaskStatus::Backlog};
  TaskPriority priority{TaskPriority::Medium};
  int progress{0};
  // Reference in an external tracker, used to match synced events.
  std::string external_ref;
  TimePoint created_at;
  TimePoint updated_at;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
};

struct NewTask {
  std::string title;
  std::string description;
  std::optional<TaskId> parent;
  TaskStatus status{TaskStatus::Backlog};
  TaskPriority priority{TaskPriority::Medium};
  std::string external_ref;
};

// Materialized ancestor record. The direct parent has depth 0.
struct HierarchyEdge {
  TaskId task;
  TaskId ancestor;
  int depth{0};

  auto operator==(const HierarchyEdge &) const -> bool = default;
};

struct DependencyEdge {
  TaskId dependent;
  TaskId dependency;
  DependencyType type{DependencyType::Blocks};
  TimePoint created_at;
};

struct StatusChange {
  TaskId task;
  TaskStatus from{TaskStatus::Backlog};
  TaskStatus to{TaskStatus::Backlog};
  std::string changed_by;
  std::string reason;
  TimePoint at;
};

} // namespace conductor
