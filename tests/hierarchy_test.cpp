#include "conductor/task/hierarchy_manager.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <optional>
#include <string>
#include <vector>

using namespace conductor;

class HierarchyTest : public ::testing::Test {
protected:
  auto make(std::string title, std::optional<TaskId> parent = std::nullopt)
      -> TaskId {
    auto id = manager_.create_task(
        tenant_, NewTask{.title = std::move(title), .parent = std::move(parent)});
    EXPECT_TRUE(id.has_value());
    return id.value_or(TaskId{});
  }

  auto progress_of(const TaskId &id) -> int {
    auto task = manager_.get_task(tenant_, id);
    EXPECT_TRUE(task.has_value());
    return task ? task->progress : -1;
  }

  ManualClock clock_{test::epoch()};
  TaskHierarchyManager manager_{clock_};
  TenantId tenant_{"acme"};
};

TEST_F(HierarchyTest, CreateRootTask) {
  auto id = make("root");
  auto task = manager_.get_task(tenant_, id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->title, "root");
  EXPECT_FALSE(task->parent.has_value());
  EXPECT_EQ(task->status, TaskStatus::Backlog);
  EXPECT_EQ(task->created_at, test::epoch());

  auto anc = manager_.ancestors(tenant_, id);
  ASSERT_TRUE(anc.has_value());
  EXPECT_TRUE(anc->empty());
}

TEST_F(HierarchyTest, EmptyTitleRejected) {
  EXPECT_TRUE(test::is_error(manager_.create_task(tenant_, NewTask{}),
                             Error::InvalidArgument));
}

TEST_F(HierarchyTest, UnknownParentRejected) {
  EXPECT_TRUE(test::is_error(
      manager_.create_task(tenant_, NewTask{.title = "orphan",
                                            .parent = TaskId("missing")}),
      Error::NotFound));
  EXPECT_EQ(manager_.task_count(tenant_), 0u);
}

TEST_F(HierarchyTest, AncestorClosureHasHopDepths) {
  auto a = make("A");
  auto b = make("B", a);
  auto c = make("C", b);

  auto anc = manager_.ancestors(tenant_, c);
  ASSERT_TRUE(anc.has_value());
  const std::vector<HierarchyEdge> expected{
      {.task = c, .ancestor = b, .depth = 0},
      {.task = c, .ancestor = a, .depth = 1},
  };
  EXPECT_EQ(*anc, expected);

  auto rebuilt = manager_.rebuild(tenant_, c);
  ASSERT_TRUE(rebuilt.has_value());
  EXPECT_EQ(*rebuilt, expected);
}

TEST_F(HierarchyTest, ReparentRebuildsDescendantClosures) {
  auto a = make("A");
  auto b = make("B", a);
  auto c = make("C", b);
  auto d = make("D");

  ASSERT_TRUE(manager_.set_parent(tenant_, b, d).has_value());

  auto anc = manager_.ancestors(tenant_, c);
  ASSERT_TRUE(anc.has_value());
  ASSERT_EQ(anc->size(), 2u);
  EXPECT_EQ((*anc)[0].ancestor, b);
  EXPECT_EQ((*anc)[1].ancestor, d);
  EXPECT_EQ((*anc)[1].depth, 1);

  auto under_a = manager_.children(tenant_, a);
  ASSERT_TRUE(under_a.has_value());
  EXPECT_TRUE(under_a->empty());

  auto under_d = manager_.descendants(tenant_, d);
  ASSERT_TRUE(under_d.has_value());
  EXPECT_EQ(under_d->size(), 2u);
}

TEST_F(HierarchyTest, DetachMakesRoot) {
  auto a = make("A");
  auto b = make("B", a);
  ASSERT_TRUE(manager_.set_parent(tenant_, b, std::nullopt).has_value());
  auto anc = manager_.ancestors(tenant_, b);
  ASSERT_TRUE(anc.has_value());
  EXPECT_TRUE(anc->empty());
}

TEST_F(HierarchyTest, ReparentUnderDescendantIsCircular) {
  auto a = make("A");
  auto b = make("B", a);
  auto c = make("C", b);

  EXPECT_TRUE(test::is_error(manager_.set_parent(tenant_, a, c),
                             Error::CircularHierarchy));
  EXPECT_TRUE(test::is_error(manager_.set_parent(tenant_, a, a),
                             Error::CircularHierarchy));

  // Nothing moved.
  auto anc = manager_.ancestors(tenant_, c);
  ASSERT_TRUE(anc.has_value());
  EXPECT_EQ(anc->size(), 2u);
}

TEST_F(HierarchyTest, DepthCeilingRejectsWithoutPartialCommit) {
  bool corrupted = false;
  HierarchyCallbacks callbacks;
  callbacks.on_corruption = [&](const TenantId &, const TaskId &) {
    corrupted = true;
  };
  manager_.set_callbacks(std::move(callbacks));

  // 52 tasks in a line: the deepest has 51 ancestors.
  std::vector<TaskId> line{make("t0")};
  for (int i = 1; i <= limits::kMaxHierarchyDepth + 1; ++i) {
    line.push_back(make("t" + std::to_string(i), line.back()));
  }
  EXPECT_FALSE(corrupted);

  EXPECT_TRUE(test::is_error(
      manager_.create_task(tenant_,
                           NewTask{.title = "too deep", .parent = line.back()}),
      Error::HierarchyTooDeep));
  EXPECT_TRUE(corrupted);

  // Moving a subtree under the deepest node fails and leaves it untouched.
  auto other = make("other");
  auto leaf = make("leaf", other);
  EXPECT_TRUE(test::is_error(manager_.set_parent(tenant_, other, line.back()),
                             Error::HierarchyTooDeep));
  auto anc = manager_.ancestors(tenant_, leaf);
  ASSERT_TRUE(anc.has_value());
  ASSERT_EQ(anc->size(), 1u);
  EXPECT_EQ((*anc)[0].ancestor, other);
}

TEST_F(HierarchyTest, ProgressIsMeanOfChildren) {
  auto parent = make("parent");
  auto c1 = make("c1", parent);
  auto c2 = make("c2", parent);
  auto c3 = make("c3", parent);

  ASSERT_TRUE(manager_.set_progress(tenant_, c1, 100).has_value());
  ASSERT_TRUE(manager_.set_progress(tenant_, c2, 50).has_value());
  EXPECT_EQ(progress_of(parent), 50);

  // Cancelled children drop out of the mean.
  ASSERT_TRUE(manager_
                  .update_status(tenant_, c3, TaskStatus::Cancelled, "test")
                  .has_value());
  EXPECT_EQ(progress_of(parent), 75);
}

TEST_F(HierarchyTest, ProgressPropagatesToRoot) {
  auto root = make("root");
  auto mid = make("mid", root);
  auto leaf = make("leaf", mid);

  ASSERT_TRUE(
      manager_.update_status(tenant_, leaf, TaskStatus::Done, "test").has_value());
  EXPECT_EQ(progress_of(leaf), limits::kMaxProgress);
  EXPECT_EQ(progress_of(mid), limits::kMaxProgress);
  EXPECT_EQ(progress_of(root), limits::kMaxProgress);
}

TEST_F(HierarchyTest, ProgressOutOfRangeRejected) {
  auto id = make("t");
  EXPECT_TRUE(test::is_error(manager_.set_progress(tenant_, id, 101),
                             Error::InvalidArgument));
  EXPECT_TRUE(test::is_error(manager_.set_progress(tenant_, id, -1),
                             Error::InvalidArgument));
}

TEST_F(HierarchyTest, StatusChangesAreRecorded) {
  std::vector<StatusChange> seen;
  HierarchyCallbacks callbacks;
  callbacks.on_status_changed = [&](const TenantId &, const Task &,
                                    const StatusChange &change) {
    seen.push_back(change);
  };
  manager_.set_callbacks(std::move(callbacks));

  auto id = make("t");
  clock_.advance(std::chrono::minutes(5));
  ASSERT_TRUE(manager_
                  .update_status(tenant_, id, TaskStatus::InProgress, "alice",
                                 "picked up")
                  .has_value());
  // Same status again is a no-op.
  ASSERT_TRUE(
      manager_.update_status(tenant_, id, TaskStatus::InProgress).has_value());

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].from, TaskStatus::Backlog);
  EXPECT_EQ(seen[0].to, TaskStatus::InProgress);
  EXPECT_EQ(seen[0].changed_by, "alice");

  auto history = manager_.status_history(tenant_, id);
  ASSERT_TRUE(history.has_value());
  ASSERT_EQ(history->size(), 1u);
  EXPECT_EQ((*history)[0].reason, "picked up");

  auto task = manager_.get_task(tenant_, id);
  ASSERT_TRUE(task.has_value());
  ASSERT_TRUE(task->started_at.has_value());
  EXPECT_EQ(*task->started_at, test::epoch() + std::chrono::minutes(5));
}

TEST_F(HierarchyTest, ExternalRefLookup) {
  auto id = manager_.create_task(
      tenant_, NewTask{.title = "synced", .external_ref = "GH-42"});
  ASSERT_TRUE(id.has_value());

  auto found = manager_.find_by_external_ref(tenant_, "GH-42");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->id, *id);

  EXPECT_TRUE(test::is_error(
      manager_.create_task(tenant_,
                           NewTask{.title = "dup", .external_ref = "GH-42"}),
      Error::AlreadyExists));
  EXPECT_TRUE(test::is_error(manager_.find_by_external_ref(tenant_, "GH-1"),
                             Error::NotFound));
}

TEST_F(HierarchyTest, RemoveTask) {
  std::vector<TaskId> removed;
  HierarchyCallbacks callbacks;
  callbacks.on_task_removed = [&](const TenantId &, const TaskId &task) {
    removed.push_back(task);
  };
  manager_.set_callbacks(std::move(callbacks));

  auto parent = make("parent");
  auto child = make("child", parent);

  EXPECT_TRUE(test::is_error(manager_.remove_task(tenant_, parent),
                             Error::HasDependents));
  ASSERT_TRUE(manager_.remove_task(tenant_, child).has_value());
  ASSERT_TRUE(manager_.remove_task(tenant_, parent).has_value());

  EXPECT_EQ(removed, (std::vector<TaskId>{child, parent}));
  EXPECT_EQ(manager_.task_count(tenant_), 0u);
  EXPECT_TRUE(test::is_error(manager_.get_task(tenant_, child), Error::NotFound));
}

TEST_F(HierarchyTest, TenantsAreIsolated) {
  auto id = make("mine");
  EXPECT_TRUE(
      test::is_error(manager_.get_task(TenantId("other"), id), Error::NotFound));
}
