#include "conductor/agent/agent_scheduler.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace conductor;
using namespace std::chrono_literals;

namespace {

// Executor whose behaviour is supplied per test.
class CallbackExecutor final : public IAgentExecutor {
public:
  explicit CallbackExecutor(
      std::function<Result<AgentResult>(const AgentRequest &)> fn)
      : fn_(std::move(fn)) {}

  [[nodiscard]] auto execute(const AgentRequest &request)
      -> Result<AgentResult> override {
    return fn_(request);
  }

private:
  std::function<Result<AgentResult>(const AgentRequest &)> fn_;
};

auto caps(std::initializer_list<const char *> names)
    -> std::vector<Capability> {
  std::vector<Capability> out;
  for (const auto *name : names) {
    out.push_back(Capability{.name = name});
  }
  return out;
}

} // namespace

class AgentSchedulerTest : public ::testing::Test {
protected:
  void SetUp() override {
    AgentCallbacks callbacks;
    callbacks.on_task_finished = [this](const AgentTask &t) {
      finished_.push_back(t);
    };
    callbacks.on_task_requeued = [this](const AgentTask &t) {
      requeued_.push_back(t);
    };
    scheduler_.set_callbacks(std::move(callbacks));
  }

  auto add_agent(std::string name, int max_tasks = 2,
                 std::vector<Capability> capabilities = {},
                 std::string type = "coder") -> AgentId {
    auto id = scheduler_.register_agent(
        tenant_, AgentSpec{.name = std::move(name),
                           .type = std::move(type),
                           .status = AgentStatus::Active,
                           .capabilities = std::move(capabilities),
                           .max_concurrent_tasks = max_tasks,
                           .timeout = 0s});
    EXPECT_TRUE(id.has_value());
    return id.value_or(AgentId{});
  }

  auto request(int priority = 3, std::optional<int> retries = std::nullopt)
      -> AgentTaskRequest {
    AgentTaskRequest req;
    req.task_type = "coder";
    req.prompt = "fix the build";
    req.priority = priority;
    req.max_retries = retries;
    return req;
  }

  auto use_fake() -> std::shared_ptr<test::FakeAgentExecutor> {
    auto fake = std::make_shared<test::FakeAgentExecutor>();
    scheduler_.set_executor(fake);
    return fake;
  }

  ManualClock clock_{test::epoch()};
  AgentScheduler scheduler_{clock_};
  TenantId tenant_{"acme"};
  std::vector<AgentTask> finished_;
  std::vector<AgentTask> requeued_;
};

TEST_F(AgentSchedulerTest, RegisterAgent) {
  auto id = add_agent("alpha");
  auto agent = scheduler_.get_agent(tenant_, id);
  ASSERT_TRUE(agent.has_value());
  EXPECT_EQ(agent->name, "alpha");
  EXPECT_EQ(agent->timeout, std::chrono::seconds(defaults::kAgentTimeout));
  EXPECT_EQ(*scheduler_.in_flight(tenant_, id), 0);

  EXPECT_TRUE(test::is_error(
      scheduler_.register_agent(tenant_, AgentSpec{.name = "alpha",
                                                   .type = "coder"}),
      Error::AlreadyExists));
  EXPECT_TRUE(test::is_error(
      scheduler_.register_agent(tenant_, AgentSpec{.name = "zero",
                                                   .type = "coder",
                                                   .max_concurrent_tasks = 0}),
      Error::InvalidArgument));
}

TEST_F(AgentSchedulerTest, CapacityIsEnforced) {
  auto agent = add_agent("alpha", 2);
  auto first = scheduler_.enqueue(tenant_, agent, request());
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(scheduler_.enqueue(tenant_, agent, request()).has_value());
  EXPECT_TRUE(test::is_error(scheduler_.enqueue(tenant_, agent, request()),
                             Error::CapacityExceeded));
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 2);

  ASSERT_TRUE(scheduler_.cancel_task(tenant_, *first).has_value());
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 1);
  EXPECT_TRUE(scheduler_.enqueue(tenant_, agent, request()).has_value());

  // Cancelling twice is a state error, not a second release.
  EXPECT_TRUE(test::is_error(scheduler_.cancel_task(tenant_, *first),
                             Error::InvalidState));
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 2);
}

TEST_F(AgentSchedulerTest, InactiveAgentRejectsWork) {
  auto agent = add_agent("alpha");
  ASSERT_TRUE(
      scheduler_.set_status(tenant_, agent, AgentStatus::Maintenance).has_value());
  EXPECT_TRUE(test::is_error(scheduler_.enqueue(tenant_, agent, request()),
                             Error::InvalidState));
  EXPECT_TRUE(test::is_error(scheduler_.schedule(tenant_, request()),
                             Error::NoAgentAvailable));
}

TEST_F(AgentSchedulerTest, InvalidPriorityRejected) {
  auto agent = add_agent("alpha");
  EXPECT_TRUE(test::is_error(scheduler_.enqueue(tenant_, agent, request(0)),
                             Error::InvalidArgument));
  EXPECT_TRUE(test::is_error(scheduler_.enqueue(tenant_, agent, request(6)),
                             Error::InvalidArgument));
}

TEST_F(AgentSchedulerTest, SelectionFiltersTypeAndCapabilities) {
  add_agent("plain");
  auto reviewer = add_agent("reviewer", 2, caps({"review", "git"}));
  add_agent("writer", 2, caps({"docs"}), "writer");

  const std::vector<std::string> needs{"review"};
  auto best = scheduler_.select_best_agent(tenant_, "coder", needs);
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(*best, reviewer);

  ASSERT_TRUE(
      scheduler_.set_capability(tenant_, reviewer, "review", false).has_value());
  EXPECT_TRUE(test::is_error(
      scheduler_.select_best_agent(tenant_, "coder", needs),
      Error::NoAgentAvailable));
  EXPECT_TRUE(test::is_error(
      scheduler_.select_best_agent(tenant_, "designer", {}),
      Error::NoAgentAvailable));
}

TEST_F(AgentSchedulerTest, SelectionPrefersHigherSuccessRate) {
  auto fake = use_fake();
  auto good = add_agent("good");
  auto bad = add_agent("bad");

  auto ok_task = scheduler_.enqueue(tenant_, good, request());
  ASSERT_TRUE(ok_task.has_value());
  auto ran = scheduler_.run_task(tenant_, *ok_task);
  ASSERT_TRUE(ran.has_value());
  EXPECT_EQ(*ran, AgentTaskStatus::Completed);

  fake->push(AgentResult{.status = AgentTaskStatus::Failed,
                         .result = {},
                         .tokens_used = 0,
                         .cost_cents = 0,
                         .capabilities_used = {},
                         .error = "hallucinated"});
  auto bad_task = scheduler_.enqueue(tenant_, bad, request(3, 0));
  ASSERT_TRUE(bad_task.has_value());
  auto failed = scheduler_.run_task(tenant_, *bad_task);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(*failed, AgentTaskStatus::Failed);

  EXPECT_DOUBLE_EQ(scheduler_.get_agent(tenant_, good)->success_rate, 100.0);
  EXPECT_DOUBLE_EQ(scheduler_.get_agent(tenant_, bad)->success_rate, 0.0);

  auto best = scheduler_.select_best_agent(tenant_, "coder", {});
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(*best, good);
}

TEST_F(AgentSchedulerTest, EqualSuccessRatePrefersFasterAgent) {
  // The prompt names how long the call takes.
  scheduler_.set_executor(std::make_shared<CallbackExecutor>(
      [this](const AgentRequest &req) -> Result<AgentResult> {
        clock_.advance(req.prompt == "slow" ? 9s : 2s);
        return ok(AgentResult{.status = AgentTaskStatus::Completed,
                              .result = "done",
                              .tokens_used = 0,
                              .cost_cents = 0,
                              .capabilities_used = {},
                              .error = {}});
      }));
  auto slow = add_agent("slow");
  auto quick = add_agent("quick");

  for (const auto &[agent, prompt] :
       {std::pair{slow, "slow"}, std::pair{quick, "quick"}}) {
    auto req = request();
    req.prompt = prompt;
    auto id = scheduler_.enqueue(tenant_, agent, std::move(req));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(scheduler_.run_task(tenant_, *id).has_value());
  }

  auto slow_stats = scheduler_.get_agent(tenant_, slow);
  auto quick_stats = scheduler_.get_agent(tenant_, quick);
  ASSERT_TRUE(slow_stats.has_value());
  ASSERT_TRUE(quick_stats.has_value());
  EXPECT_DOUBLE_EQ(slow_stats->success_rate, 100.0);
  EXPECT_DOUBLE_EQ(quick_stats->success_rate, 100.0);
  EXPECT_EQ(slow_stats->average_completion_time, 9000ms);
  EXPECT_EQ(quick_stats->average_completion_time, 2000ms);

  auto best = scheduler_.select_best_agent(tenant_, "coder", {});
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(*best, quick);
}

TEST_F(AgentSchedulerTest, SuccessRateForgetsOutcomesOutsideWindow) {
  auto fake = use_fake();
  auto agent = add_agent("alpha");

  fake->push(fail(Error::HandlerFailed));
  auto failed = scheduler_.enqueue(tenant_, agent, request(3, 0));
  ASSERT_TRUE(failed.has_value());
  ASSERT_TRUE(scheduler_.run_task(tenant_, *failed).has_value());
  EXPECT_DOUBLE_EQ(scheduler_.get_agent(tenant_, agent)->success_rate, 0.0);

  clock_.advance(std::chrono::days(29));
  auto inside = scheduler_.enqueue(tenant_, agent, request());
  ASSERT_TRUE(inside.has_value());
  ASSERT_TRUE(scheduler_.run_task(tenant_, *inside).has_value());
  EXPECT_DOUBLE_EQ(scheduler_.get_agent(tenant_, agent)->success_rate, 50.0);

  // The failure is now 31 days old.
  clock_.advance(std::chrono::days(2));
  auto outside = scheduler_.enqueue(tenant_, agent, request());
  ASSERT_TRUE(outside.has_value());
  ASSERT_TRUE(scheduler_.run_task(tenant_, *outside).has_value());
  auto stats = scheduler_.get_agent(tenant_, agent);
  ASSERT_TRUE(stats.has_value());
  EXPECT_DOUBLE_EQ(stats->success_rate, 100.0);
  EXPECT_EQ(stats->total_tasks_completed, 2);
}

TEST_F(AgentSchedulerTest, PurgeDropsOnlyOldTerminalTasks) {
  use_fake();
  auto agent = add_agent("alpha");
  auto done = scheduler_.enqueue(tenant_, agent, request());
  ASSERT_TRUE(done.has_value());
  ASSERT_TRUE(scheduler_.run_task(tenant_, *done).has_value());
  auto queued = scheduler_.enqueue(tenant_, agent, request());
  ASSERT_TRUE(queued.has_value());

  EXPECT_EQ(scheduler_.purge_finished_before(clock_.now()), 0u);

  clock_.advance(1h);
  EXPECT_EQ(scheduler_.purge_finished_before(clock_.now()), 1u);
  EXPECT_TRUE(test::is_error(scheduler_.get_task(tenant_, *done),
                             Error::NotFound));
  EXPECT_TRUE(scheduler_.get_task(tenant_, *queued).has_value());
  EXPECT_EQ(scheduler_.get_agent(tenant_, agent)->total_tasks_completed, 1);
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 1);
}

TEST_F(AgentSchedulerTest, ScheduleFallsThroughFullAgents) {
  auto only_one = add_agent("tiny", 1);
  auto roomy = add_agent("roomy", 3);

  std::vector<AgentTaskId> ids;
  for (int i = 0; i < 4; ++i) {
    auto id = scheduler_.schedule(tenant_, request());
    ASSERT_TRUE(id.has_value()) << i;
    ids.push_back(*id);
  }
  EXPECT_EQ(*scheduler_.in_flight(tenant_, only_one), 1);
  EXPECT_EQ(*scheduler_.in_flight(tenant_, roomy), 3);
  EXPECT_TRUE(test::is_error(scheduler_.schedule(tenant_, request()),
                             Error::NoAgentAvailable));
}

TEST_F(AgentSchedulerTest, RunTaskRecordsUsage) {
  auto fake = use_fake();
  auto agent = add_agent("alpha", 2, caps({"git"}));
  auto req = request();
  req.required_capabilities = {"git"};
  auto task_id = scheduler_.enqueue(tenant_, agent, req);
  ASSERT_TRUE(task_id.has_value());

  ASSERT_TRUE(scheduler_.run_task(tenant_, *task_id).has_value());
  ASSERT_EQ(fake->requests().size(), 1u);
  EXPECT_EQ(fake->requests()[0].prompt, "fix the build");

  auto task = scheduler_.get_task(tenant_, *task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, AgentTaskStatus::Completed);
  EXPECT_EQ(task->result, "done");

  auto stats = scheduler_.get_agent(tenant_, agent);
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total_tasks_completed, 1);
  EXPECT_EQ(stats->total_tokens_used, 10);
  EXPECT_EQ(stats->total_cost_cents, 1);
  ASSERT_NE(stats->find_capability("git"), nullptr);
  EXPECT_EQ(stats->find_capability("git")->usage_count, 1);
  EXPECT_EQ(stats->find_capability("git")->success_count, 1);
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 0);
  ASSERT_EQ(finished_.size(), 1u);
}

TEST_F(AgentSchedulerTest, FailedAttemptIsRequeuedUntilRetriesRunOut) {
  auto fake = use_fake();
  auto agent = add_agent("alpha");
  fake->push(fail(Error::HandlerFailed));
  fake->push(fail(Error::HandlerFailed));

  auto task_id = scheduler_.enqueue(tenant_, agent, request(3, 1));
  ASSERT_TRUE(task_id.has_value());

  auto first = scheduler_.run_task(tenant_, *task_id);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, AgentTaskStatus::Queued);
  ASSERT_EQ(requeued_.size(), 1u);
  EXPECT_EQ(requeued_[0].retry_count, 1);
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 1);

  auto second = scheduler_.run_task(tenant_, *task_id);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, AgentTaskStatus::Failed);
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 0);

  auto task = scheduler_.get_task(tenant_, *task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_FALSE(task->error_message.empty());
  ASSERT_EQ(finished_.size(), 1u);
  EXPECT_EQ(finished_[0].status, AgentTaskStatus::Failed);
}

TEST_F(AgentSchedulerTest, RunWithoutExecutorIsInvalid) {
  auto agent = add_agent("alpha");
  auto task_id = scheduler_.enqueue(tenant_, agent, request());
  ASSERT_TRUE(task_id.has_value());
  EXPECT_FALSE(scheduler_.has_executor());
  EXPECT_TRUE(test::is_error(scheduler_.run_task(tenant_, *task_id),
                             Error::InvalidState));
  EXPECT_EQ(scheduler_.get_task(tenant_, *task_id)->status,
            AgentTaskStatus::Queued);
}

TEST_F(AgentSchedulerTest, TimedOutTaskDiscardsLateResult) {
  auto agent = add_agent("alpha");
  scheduler_.set_executor(std::make_shared<CallbackExecutor>(
      [this](const AgentRequest &) -> Result<AgentResult> {
        clock_.advance(std::chrono::seconds(defaults::kAgentTimeout) + 1s);
        EXPECT_EQ(scheduler_.reap_timeouts(clock_.now()), 1u);
        return ok(AgentResult{});
      }));

  auto task_id = scheduler_.enqueue(tenant_, agent, request());
  ASSERT_TRUE(task_id.has_value());
  EXPECT_TRUE(test::is_error(scheduler_.run_task(tenant_, *task_id),
                             Error::InvalidState));

  auto task = scheduler_.get_task(tenant_, *task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, AgentTaskStatus::Timeout);
  EXPECT_EQ(*scheduler_.in_flight(tenant_, agent), 0);
  ASSERT_EQ(finished_.size(), 1u);
}

TEST_F(AgentSchedulerTest, ThrowingExecutorCountsAsFailure) {
  auto agent = add_agent("alpha");
  scheduler_.set_executor(std::make_shared<CallbackExecutor>(
      [](const AgentRequest &) -> Result<AgentResult> {
        throw std::runtime_error("socket closed");
      }));
  auto task_id = scheduler_.enqueue(tenant_, agent, request(3, 0));
  ASSERT_TRUE(task_id.has_value());
  auto res = scheduler_.run_task(tenant_, *task_id);
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(*res, AgentTaskStatus::Failed);
  EXPECT_NE(scheduler_.get_task(tenant_, *task_id)->error_message.find(
                "socket closed"),
            std::string::npos);
}

TEST_F(AgentSchedulerTest, NextQueuedOrdersByPriorityThenAge) {
  auto agent = add_agent("alpha", 5);
  auto low = scheduler_.enqueue(tenant_, agent, request(4));
  clock_.advance(1s);
  auto urgent_old = scheduler_.enqueue(tenant_, agent, request(1));
  clock_.advance(1s);
  auto urgent_new = scheduler_.enqueue(tenant_, agent, request(1));
  ASSERT_TRUE(low && urgent_old && urgent_new);

  auto next = scheduler_.next_queued(tenant_, agent);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->id, *urgent_old);

  ASSERT_TRUE(scheduler_.cancel_task(tenant_, *urgent_old).has_value());
  next = scheduler_.next_queued(tenant_, agent);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->id, *urgent_new);
  EXPECT_EQ(scheduler_.tasks_of(tenant_, agent).size(), 3u);
}
