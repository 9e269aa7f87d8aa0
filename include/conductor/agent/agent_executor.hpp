#pragma once

#include "conductor/agent/agent.hpp"
#include "conductor/core/error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace conductor {

struct AgentRequest {
  AgentTaskId task;
  std::string prompt;
  std::string context;
  std::string task_type;
};

struct AgentResult {
  // Completed or Failed; anything else is treated as Failed.
  AgentTaskStatus status{AgentTaskStatus::Completed};
  std::string result;
  std::int64_t tokens_used{0};
  std::int64_t cost_cents{0};
  std::vector<std::string> capabilities_used;
  std::string error;
};

// Boundary to the runtime that actually carries out agent work. Called
// without any scheduler lock held; may block.
class IAgentExecutor {
public:
  virtual ~IAgentExecutor() = default;

  [[nodiscard]] virtual auto execute(const AgentRequest &request)
      -> Result<AgentResult> = 0;
};

} // namespace conductor
