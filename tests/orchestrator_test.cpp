#include "conductor/app/orchestrator.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace conductor;
using namespace std::chrono_literals;

namespace {

auto command(std::string name, std::vector<std::string> deps = {})
    -> StepTemplate {
  StepTemplate s;
  s.name = std::move(name);
  s.depends_on = std::move(deps);
  return s;
}

auto agent_step(std::string name, std::vector<std::string> deps = {})
    -> StepTemplate {
  StepTemplate s;
  s.name = std::move(name);
  s.type = StepType::Agent;
  s.depends_on = std::move(deps);
  s.agent_type = "reviewer";
  s.prompt = "review the change";
  s.capabilities = {"code_review"};
  return s;
}

auto count_type(const std::vector<NotificationRecord> &records,
                NotificationType type) -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count_if(records, [&](const NotificationRecord &r) {
        return r.type == type;
      }));
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    runner_ = std::make_shared<test::RecordingStepRunner>();
    orch_.set_step_runner(runner_);
  }

  auto register_pipeline(std::vector<StepTemplate> steps,
                         std::vector<std::string> triggers = {"push"})
      -> PipelineId {
    PipelineDefinition def;
    def.name = "ci";
    def.steps = std::move(steps);
    def.trigger_events = std::move(triggers);
    auto id = orch_.pipelines().register_pipeline(tenant_, std::move(def));
    EXPECT_TRUE(id.has_value());
    return id.value_or(PipelineId{});
  }

  auto make_task(std::string title, std::string external_ref = {}) -> TaskId {
    auto id = orch_.hierarchy().create_task(
        tenant_, NewTask{.title = std::move(title),
                         .description = {},
                         .parent = std::nullopt,
                         .status = TaskStatus::Todo,
                         .priority = TaskPriority::Medium,
                         .external_ref = std::move(external_ref)});
    EXPECT_TRUE(id.has_value());
    return id.value_or(TaskId{});
  }

  auto register_reviewer() -> AgentId {
    AgentSpec spec;
    spec.name = "reviewer-1";
    spec.type = "reviewer";
    spec.capabilities = {Capability{.name = "code_review"}};
    spec.max_concurrent_tasks = 0;
    auto id = orch_.register_agent(tenant_, std::move(spec));
    EXPECT_TRUE(id.has_value());
    return id.value_or(AgentId{});
  }

  auto event(std::string source, std::string external_id, std::string type,
             std::string payload) -> InboundEvent {
    InboundEvent e;
    e.integration = IntegrationId(source + "-main");
    e.source = std::move(source);
    e.external_event_id = std::move(external_id);
    e.event_type = std::move(type);
    e.payload = std::move(payload);
    return e;
  }

  auto execution(const ExecutionId &id) -> PipelineExecution {
    auto exec = orch_.pipelines().get_execution(tenant_, id);
    EXPECT_TRUE(exec.has_value());
    return exec.value_or(PipelineExecution{});
  }

  auto task_status(const TaskId &id) -> TaskStatus {
    auto task = orch_.hierarchy().get_task(tenant_, id);
    EXPECT_TRUE(task.has_value());
    return task ? task->status : TaskStatus::Backlog;
  }

  boost::asio::io_context ctx_;
  ManualClock clock_{test::epoch()};
  SystemConfig config_{};
  Orchestrator orch_{ctx_.get_executor(), clock_, config_};
  std::shared_ptr<test::RecordingStepRunner> runner_;
  TenantId tenant_{"acme"};
};

TEST_F(OrchestratorTest, RunPipelineCompletesLinkedTask) {
  auto pipeline = register_pipeline(
      {command("build"), command("test", {"build"}), command("deploy", {"test"})});
  auto task = make_task("Ship release");

  auto exec = orch_.run_pipeline(
      tenant_, pipeline, TriggerRequest{.trigger_event = "manual",
                                        .trigger_data = {},
                                        .task = task});
  ASSERT_TRUE(exec.has_value());
  EXPECT_EQ(task_status(task), TaskStatus::InProgress);

  ctx_.run();

  auto done = execution(*exec);
  EXPECT_EQ(done.status, ExecutionStatus::Completed);
  EXPECT_EQ(runner_->ran(),
            (std::vector<std::string>{"build", "test", "deploy"}));
  ASSERT_NE(done.find_step("deploy"), nullptr);
  EXPECT_EQ(done.find_step("deploy")->output, "deploy ok");
  EXPECT_EQ(task_status(task), TaskStatus::Done);
  EXPECT_EQ(orch_.outbox().pending(), 0u);
}

TEST_F(OrchestratorTest, FailedStepBlocksTaskAndNotifies) {
  auto pipeline =
      register_pipeline({command("build"), command("deploy", {"build"})});
  auto task = make_task("Hotfix");
  runner_->failing = {"build"};

  auto exec = orch_.run_pipeline(
      tenant_, pipeline, TriggerRequest{.trigger_event = "manual",
                                        .trigger_data = {},
                                        .task = task});
  ASSERT_TRUE(exec.has_value());
  ctx_.run();

  auto failed = execution(*exec);
  EXPECT_EQ(failed.status, ExecutionStatus::Failed);
  EXPECT_EQ(failed.find_step("deploy")->status, StepStatus::Skipped);
  EXPECT_EQ(task_status(task), TaskStatus::Blocked);

  auto records = orch_.outbox().drain();
  ASSERT_EQ(count_type(records, NotificationType::PipelineFailed), 1u);
  EXPECT_NE(records.front().details.find(exec->str()), std::string::npos);
}

TEST_F(OrchestratorTest, AgentStepRunsThroughExecutor) {
  auto executor = std::make_shared<test::FakeAgentExecutor>();
  orch_.set_agent_executor(executor);
  auto agent = register_reviewer();
  auto pipeline =
      register_pipeline({command("build"), agent_step("review", {"build"})});

  auto exec = orch_.run_pipeline(tenant_, pipeline, TriggerRequest{});
  ASSERT_TRUE(exec.has_value());
  ctx_.run();

  auto done = execution(*exec);
  EXPECT_EQ(done.status, ExecutionStatus::Completed);
  EXPECT_EQ(done.find_step("review")->output, "done");

  auto requests = executor->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].task_type, "reviewer");
  EXPECT_EQ(requests[0].prompt, "review the change");
  EXPECT_NE(requests[0].context.find("\"step\":\"review\""),
            std::string::npos);

  auto tasks = orch_.agents().tasks_of(tenant_, agent);
  ASSERT_EQ(tasks.size(), 1u);
  EXPECT_EQ(tasks[0].status, AgentTaskStatus::Completed);
  EXPECT_EQ(tasks[0].tokens_used, 10);
}

TEST_F(OrchestratorTest, FailedAgentTaskFailsStep) {
  auto executor = std::make_shared<test::FakeAgentExecutor>();
  executor->push(AgentResult{.status = AgentTaskStatus::Failed,
                             .result = {},
                             .tokens_used = 3,
                             .cost_cents = 0,
                             .capabilities_used = {},
                             .error = "model refused"});
  orch_.set_agent_executor(executor);
  register_reviewer();
  auto pipeline = register_pipeline({agent_step("review")});

  auto exec = orch_.run_pipeline(tenant_, pipeline, TriggerRequest{});
  ASSERT_TRUE(exec.has_value());
  ctx_.run();

  auto failed = execution(*exec);
  EXPECT_EQ(failed.status, ExecutionStatus::Failed);
  EXPECT_EQ(failed.find_step("review")->error, "model refused");

  auto records = orch_.outbox().drain();
  EXPECT_EQ(count_type(records, NotificationType::AgentTaskFailed), 1u);
  EXPECT_EQ(count_type(records, NotificationType::PipelineFailed), 1u);
}

TEST_F(OrchestratorTest, AgentStepWithoutAgentFails) {
  auto pipeline = register_pipeline({agent_step("review")});

  auto exec = orch_.run_pipeline(tenant_, pipeline, TriggerRequest{});
  ASSERT_TRUE(exec.has_value());
  ctx_.run();

  auto failed = execution(*exec);
  EXPECT_EQ(failed.status, ExecutionStatus::Failed);
  EXPECT_NE(failed.find_step("review")->error.find("agent dispatch failed"),
            std::string::npos);
}

TEST_F(OrchestratorTest, AgentTaskWaitsWithoutExecutor) {
  auto agent = register_reviewer();
  auto pipeline = register_pipeline({agent_step("review")});

  auto exec = orch_.run_pipeline(tenant_, pipeline, TriggerRequest{});
  ASSERT_TRUE(exec.has_value());
  ctx_.run();

  EXPECT_EQ(execution(*exec).status, ExecutionStatus::Running);
  auto queued = orch_.agents().next_queued(tenant_, agent);
  ASSERT_TRUE(queued.has_value());
  ASSERT_TRUE(queued->step.has_value());
  EXPECT_EQ(queued->step->step, "review");

  // Cancelling the execution withdraws the queued agent task.
  ASSERT_TRUE(orch_.pipelines().cancel(tenant_, *exec).has_value());
  ctx_.run();
  auto cancelled = orch_.agents().get_task(tenant_, queued->id);
  ASSERT_TRUE(cancelled.has_value());
  EXPECT_EQ(cancelled->status, AgentTaskStatus::Cancelled);
}

TEST_F(OrchestratorTest, CancelledExecutionDispatchesNoAgentTask) {
  auto agent = register_reviewer();
  auto pipeline = register_pipeline({agent_step("review")});

  // The dispatch of the root step is still queued on the context when the
  // execution is cancelled.
  auto exec = orch_.run_pipeline(tenant_, pipeline, TriggerRequest{});
  ASSERT_TRUE(exec.has_value());
  ASSERT_TRUE(orch_.pipelines().cancel(tenant_, *exec).has_value());
  ctx_.run();

  EXPECT_EQ(execution(*exec).status, ExecutionStatus::Cancelled);
  EXPECT_TRUE(orch_.agents().tasks_of(tenant_, agent).empty());
  auto in_flight = orch_.agents().in_flight(tenant_, agent);
  ASSERT_TRUE(in_flight.has_value());
  EXPECT_EQ(*in_flight, 0);
}

TEST_F(OrchestratorTest, LinkedTaskEndsDoneOnThreadedContext) {
  auto pipeline = register_pipeline({command("build")});
  // Declared first so the guard is released before the workers are joined.
  std::vector<std::jthread> workers;
  auto guard = boost::asio::make_work_guard(ctx_);
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([this] { ctx_.run(); });
  }

  for (int round = 0; round < 50; ++round) {
    auto task = make_task("Release " + std::to_string(round));
    auto exec = orch_.run_pipeline(
        tenant_, pipeline, TriggerRequest{.trigger_event = "manual",
                                          .trigger_data = {},
                                          .task = task});
    ASSERT_TRUE(exec.has_value());

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    auto current = orch_.hierarchy().get_task(tenant_, task);
    while (current && current->status != TaskStatus::Done &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(1ms);
      current = orch_.hierarchy().get_task(tenant_, task);
    }
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->status, TaskStatus::Done) << "round " << round;
    EXPECT_TRUE(current->completed_at.has_value());
  }

  guard.reset();
  workers.clear();
  EXPECT_EQ(runner_->ran().size(), 50u);
}

TEST_F(OrchestratorTest, IngestedEventStartsMatchingPipeline) {
  auto pipeline = register_pipeline({command("build")}, {"push"});
  auto task = make_task("Feature", "PROJ-7");
  orch_.accept_source("github");

  auto outcome = orch_.ingest(
      tenant_, event("github", "delivery-1", "push",
                     R"({"ref":"main","external_ref":"PROJ-7"})"));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(outcome->duplicate);
  ctx_.run();

  auto processed = orch_.ingestion().get_event(tenant_, outcome->id);
  ASSERT_TRUE(processed.has_value());
  EXPECT_EQ(processed->status, ProcessingStatus::Processed);

  auto execs = orch_.pipelines().executions_of(tenant_, pipeline);
  ASSERT_EQ(execs.size(), 1u);
  EXPECT_EQ(execs[0].status, ExecutionStatus::Completed);
  EXPECT_EQ(execs[0].trigger_event, "push");
  ASSERT_TRUE(execs[0].task.has_value());
  EXPECT_EQ(*execs[0].task, task);
  EXPECT_EQ(task_status(task), TaskStatus::Done);

  // A redelivery is deduplicated and starts nothing.
  auto again = orch_.ingest(
      tenant_, event("github", "delivery-1", "push", R"({"ref":"main"})"));
  ASSERT_TRUE(again.has_value());
  EXPECT_TRUE(again->duplicate);
  ctx_.run();
  EXPECT_EQ(orch_.pipelines().executions_of(tenant_, pipeline).size(), 1u);
}

TEST_F(OrchestratorTest, UnacceptedSourceDoesNotTrigger) {
  auto pipeline = register_pipeline({command("build")}, {"push"});

  auto outcome = orch_.ingest(
      tenant_, event("gitlab", "delivery-1", "push", R"({"ref":"main"})"));
  ASSERT_TRUE(outcome.has_value());
  ctx_.run();

  auto ev = orch_.ingestion().get_event(tenant_, outcome->id);
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->status, ProcessingStatus::Failed);
  EXPECT_TRUE(orch_.pipelines().executions_of(tenant_, pipeline).empty());
}

TEST_F(OrchestratorTest, TaskSyncCreatesAndLinksTasks) {
  ASSERT_TRUE(orch_
                  .ingest(tenant_,
                          event(std::string(kTaskSyncSource), "1",
                                "issue.created",
                                R"({"external_ref":"EPIC-1","title":"Epic",)"
                                R"("priority":"high"})"))
                  .has_value());
  ASSERT_TRUE(orch_
                  .ingest(tenant_,
                          event(std::string(kTaskSyncSource), "2",
                                "issue.created",
                                R"({"external_ref":"API-1","title":"API",)"
                                R"("parent_external_ref":"EPIC-1"})"))
                  .has_value());
  ctx_.run();
  ASSERT_TRUE(orch_
                  .ingest(tenant_,
                          event(std::string(kTaskSyncSource), "3",
                                "issue.created",
                                R"({"external_ref":"UI-1","title":"UI",)"
                                R"("parent_external_ref":"EPIC-1",)"
                                R"("depends_on_external_refs":["API-1"]})"))
                  .has_value());
  ctx_.run();

  auto epic = orch_.hierarchy().find_by_external_ref(tenant_, "EPIC-1");
  auto api = orch_.hierarchy().find_by_external_ref(tenant_, "API-1");
  auto ui = orch_.hierarchy().find_by_external_ref(tenant_, "UI-1");
  ASSERT_TRUE(epic && api && ui);
  EXPECT_EQ(epic->priority, TaskPriority::High);
  EXPECT_EQ(api->parent, epic->id);
  EXPECT_EQ(ui->parent, epic->id);
  EXPECT_EQ(orch_.dependencies().blockers_of(tenant_, ui->id),
            (std::vector<TaskId>{api->id}));

  // A later event for a known reference updates the existing task.
  ASSERT_TRUE(orch_
                  .ingest(tenant_,
                          event(std::string(kTaskSyncSource), "4",
                                "issue.updated",
                                R"({"external_ref":"API-1","status":"done"})"))
                  .has_value());
  ctx_.run();
  EXPECT_EQ(task_status(api->id), TaskStatus::Done);
  EXPECT_EQ(orch_.hierarchy().task_count(tenant_), 3u);
}

TEST_F(OrchestratorTest, TaskSyncRejectsUnknownStatus) {
  auto outcome = orch_.ingest(
      tenant_, event(std::string(kTaskSyncSource), "1", "issue.created",
                     R"({"external_ref":"X-1","title":"X","status":"bogus"})"));
  ASSERT_TRUE(outcome.has_value());
  ctx_.run();

  auto ev = orch_.ingestion().get_event(tenant_, outcome->id);
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->status, ProcessingStatus::Retrying);
  EXPECT_FALSE(
      orch_.hierarchy().find_by_external_ref(tenant_, "X-1").has_value());
}

TEST_F(OrchestratorTest, RegisterAgentAppliesConfiguredCapacity) {
  auto id = register_reviewer();
  auto agent = orch_.agents().get_agent(tenant_, id);
  ASSERT_TRUE(agent.has_value());
  EXPECT_EQ(agent->max_concurrent_tasks,
            config_.agent.default_max_concurrent_tasks);
}

TEST_F(OrchestratorTest, LoadPipelinesFromDirectory) {
  test::TempDir dir;
  dir.write("ci.toml", R"(
name = "ci"
trigger_events = ["push"]

[[steps]]
name = "build"
command = "make"
)");
  dir.write("broken.toml", "name = \"broken\"\n");

  auto loaded = orch_.load_pipelines(tenant_, dir.path());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, 1u);
  EXPECT_TRUE(orch_.pipelines().find_pipeline(tenant_, "ci").has_value());
}
