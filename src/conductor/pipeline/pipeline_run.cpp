#include "conductor/pipeline/pipeline_run.hpp"

#include "conductor/util/id.hpp"
#include "conductor/util/log.hpp"

#include <format>
#include <utility>

namespace conductor {

PipelineRun::PipelineRun(std::shared_ptr<const StepGraph> graph)
    : graph_(std::move(graph)) {
  const std::size_t n = graph_->size();
  steps_.resize(n);
  in_degree_.resize(n, 0);
  completed_dep_count_.resize(n, 0);
  ready_mask_.resize(n);
  running_mask_.resize(n);
  terminal_mask_.resize(n);
  failed_mask_.resize(n);

  for (NodeIndex i = 0; i < n; ++i) {
    steps_[i].id = generate_id<StepId>("step");
    steps_[i].idx = i;
    steps_[i].max_retries = graph_->max_retries(i);
    in_degree_[i] = graph_->deps(i).size();
    if (in_degree_[i] == 0) {
      ready_mask_.set(i);
    }
  }
}

auto PipelineRun::ready_steps() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  out.reserve(ready_mask_.count());
  for (auto i = ready_mask_.find_first(); i != boost::dynamic_bitset<>::npos;
       i = ready_mask_.find_next(i)) {
    out.push_back(static_cast<NodeIndex>(i));
  }
  return out;
}

auto PipelineRun::start_ready(TimePoint now) -> std::vector<NodeIndex> {
  auto ready = ready_steps();
  for (NodeIndex idx : ready) {
    ready_mask_.reset(idx);
    running_mask_.set(idx);
    auto &step = steps_[idx];
    step.status = StepStatus::Running;
    step.started_at = now;
    step.completed_at.reset();
  }
  return ready;
}

auto PipelineRun::mark_completed(NodeIndex idx, std::string output,
                                 TimePoint now) -> Result<void> {
  if (idx >= steps_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  if (!running_mask_.test(idx)) {
    return fail(Error::InvalidState);
  }
  steps_[idx].output = std::move(output);
  steps_[idx].error.clear();
  set_terminal(idx, StepStatus::Completed, now);

  for (NodeIndex dep : graph_->dependents(idx)) {
    if (++completed_dep_count_[dep] == in_degree_[dep] &&
        steps_[dep].status == StepStatus::Pending) {
      ready_mask_.set(dep);
    }
  }
  return ok();
}

auto PipelineRun::mark_failed(NodeIndex idx, std::string error, TimePoint now)
    -> Result<FailureOutcome> {
  if (idx >= steps_.size()) [[unlikely]] {
    return fail(Error::NotFound);
  }
  if (!running_mask_.test(idx)) {
    return fail(Error::InvalidState);
  }
  auto &step = steps_[idx];
  step.error = std::move(error);

  if (step.retry_count < step.max_retries) {
    ++step.retry_count;
    step.status = StepStatus::Pending;
    running_mask_.reset(idx);
    ready_mask_.set(idx);
    log::debug("Step {} failed, retry {}/{}", graph_->name_of(idx),
               step.retry_count, step.max_retries);
    return ok(FailureOutcome::Retrying);
  }

  set_terminal(idx, StepStatus::Failed, now);
  failed_mask_.set(idx);
  skip_downstream(idx, now);
  return ok(FailureOutcome::Failed);
}

auto PipelineRun::cancel(TimePoint now) -> void {
  for (NodeIndex i = 0; i < steps_.size(); ++i) {
    if (!terminal_mask_.test(i)) {
      set_terminal(i, StepStatus::Cancelled, now);
    }
  }
}

auto PipelineRun::is_complete() const noexcept -> bool {
  return terminal_mask_.all();
}

auto PipelineRun::info(NodeIndex idx) const -> const StepRunInfo & {
  return steps_.at(idx);
}

auto PipelineRun::set_terminal(NodeIndex idx, StepStatus status, TimePoint now)
    -> void {
  auto &step = steps_[idx];
  ready_mask_.reset(idx);
  running_mask_.reset(idx);
  terminal_mask_.set(idx);
  step.status = status;
  step.completed_at = now;
}

// Pending steps reachable from `idx` can never run any more.
auto PipelineRun::skip_downstream(NodeIndex idx, TimePoint now) -> void {
  std::vector<NodeIndex> stack{idx};
  while (!stack.empty()) {
    NodeIndex node = stack.back();
    stack.pop_back();
    for (NodeIndex dep : graph_->dependents(node)) {
      if (terminal_mask_.test(dep) || running_mask_.test(dep)) {
        continue;
      }
      steps_[dep].error = std::format("upstream step '{}' did not complete",
                                      graph_->name_of(node));
      set_terminal(dep, StepStatus::Skipped, now);
      stack.push_back(dep);
    }
  }
}

} // namespace conductor
