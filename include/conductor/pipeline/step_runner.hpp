#pragma once

#include "conductor/pipeline/pipeline.hpp"

#include <string>

namespace conductor {

struct StepOutcome {
  bool success{true};
  std::string output;
  std::string error;
};

// Carries out command, webhook and condition steps. Agent steps go through
// the AgentScheduler instead. Called without any executor lock held; may
// block.
class IStepRunner {
public:
  virtual ~IStepRunner() = default;

  [[nodiscard]] virtual auto run(const StepDispatch &step) -> StepOutcome = 0;
};

// Acknowledges every step without running anything. Used when no external
// runner is attached, so pipelines still advance end to end.
class PassThroughStepRunner final : public IStepRunner {
public:
  [[nodiscard]] auto run(const StepDispatch &step) -> StepOutcome override {
    return StepOutcome{.success = true,
                       .output = std::string(to_string_view(step.spec.type)) +
                                 " step acknowledged",
                       .error = {}};
  }
};

} // namespace conductor
