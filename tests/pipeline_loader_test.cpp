#include "conductor/pipeline/pipeline_loader.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <filesystem>
#include <string>

using namespace conductor;

namespace {

constexpr const char *kReviewPipeline = R"(
name = "review"
description = "Build, test and ask an agent for review"
max_concurrent_executions = 2
timeout_minutes = 15
trigger_events = ["pull_request.opened"]

[[steps]]
name = "build"
command = "make"

[[steps]]
name = "test"
command = "make test"
depends_on = ["build"]
max_retries = 2

[[steps]]
name = "review"
type = "agent"
agent_type = "reviewer"
prompt = "Review the diff"
capabilities = ["code_review"]
priority = 2
depends_on = ["test"]
)";

} // namespace

class PipelineLoaderTest : public ::testing::Test {
protected:
  test::TempDir dir_;
};

TEST_F(PipelineLoaderTest, LoadValidPipeline) {
  auto def = PipelineLoader::load_from_string(kReviewPipeline);
  ASSERT_TRUE(def.has_value());

  EXPECT_EQ(def->name, "review");
  EXPECT_EQ(def->max_concurrent_executions, 2);
  EXPECT_EQ(def->timeout, std::chrono::minutes(15));
  EXPECT_TRUE(def->active);
  ASSERT_EQ(def->trigger_events.size(), 1u);
  EXPECT_EQ(def->trigger_events[0], "pull_request.opened");

  ASSERT_EQ(def->steps.size(), 3u);
  EXPECT_EQ(def->steps[0].type, StepType::Command);
  EXPECT_EQ(def->steps[0].command, "make");
  EXPECT_EQ(def->steps[1].max_retries, 2);
  EXPECT_EQ(def->steps[2].type, StepType::Agent);
  EXPECT_EQ(def->steps[2].agent_type, "reviewer");
  EXPECT_EQ(def->steps[2].priority, 2);
  ASSERT_EQ(def->steps[2].capabilities.size(), 1u);
}

TEST_F(PipelineLoaderTest, OmittedLimitsStayZero) {
  auto def = PipelineLoader::load_from_string(R"(
name = "minimal"

[[steps]]
name = "only"
)");
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->max_concurrent_executions, 0);
  EXPECT_EQ(def->timeout.count(), 0);
  EXPECT_EQ(def->steps[0].type, StepType::Command);
}

TEST_F(PipelineLoaderTest, RejectsPipelineWithoutSteps) {
  std::string diag;
  auto def = PipelineLoader::load_from_string("name = \"empty\"\n", &diag);
  EXPECT_TRUE(test::is_error(def, Error::InvalidArgument));
  EXPECT_NE(diag.find("no steps"), std::string::npos);
}

TEST_F(PipelineLoaderTest, RejectsUnknownStepType) {
  std::string diag;
  auto def = PipelineLoader::load_from_string(R"(
name = "bad"

[[steps]]
name = "x"
type = "teleport"
)",
                                              &diag);
  EXPECT_TRUE(test::is_error(def, Error::InvalidArgument));
  EXPECT_NE(diag.find("teleport"), std::string::npos);
}

TEST_F(PipelineLoaderTest, RejectsAgentStepWithoutAgentType) {
  auto def = PipelineLoader::load_from_string(R"(
name = "bad"

[[steps]]
name = "x"
type = "agent"
)");
  EXPECT_TRUE(test::is_error(def, Error::InvalidArgument));
}

TEST_F(PipelineLoaderTest, RejectsCycle) {
  auto def = PipelineLoader::load_from_string(R"(
name = "loop"

[[steps]]
name = "a"
depends_on = ["b"]

[[steps]]
name = "b"
depends_on = ["a"]
)");
  EXPECT_TRUE(test::is_error(def, Error::CycleDetected));
}

TEST_F(PipelineLoaderTest, RejectsUnknownDependency) {
  std::string diag;
  auto def = PipelineLoader::load_from_string(R"(
name = "dangling"

[[steps]]
name = "a"
depends_on = ["ghost"]
)",
                                              &diag);
  EXPECT_TRUE(test::is_error(def, Error::InvalidArgument));
  EXPECT_NE(diag.find("ghost"), std::string::npos);
}

TEST_F(PipelineLoaderTest, MalformedTomlIsParseError) {
  auto def = PipelineLoader::load_from_string("name = \"unterminated\n");
  EXPECT_TRUE(test::is_error(def, Error::ParseError));
}

TEST_F(PipelineLoaderTest, LoadFromFile) {
  auto path = dir_.write("review.toml", kReviewPipeline);
  auto def = PipelineLoader::load_from_file(path.string());
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->name, "review");

  EXPECT_TRUE(test::is_error(
      PipelineLoader::load_from_file((dir_.path() / "missing.toml").string()),
      Error::FileNotFound));
}

TEST_F(PipelineLoaderTest, LoadDirectorySkipsBadFiles) {
  dir_.write("b_review.toml", kReviewPipeline);
  dir_.write("a_broken.toml", "name = \"broken\"\n");
  dir_.write("notes.txt", "not a pipeline");
  dir_.write("c_small.toml", "name = \"small\"\n[[steps]]\nname = \"s\"\n");

  auto files = PipelineLoader::load_directory(dir_.path());
  ASSERT_TRUE(files.has_value());
  ASSERT_EQ(files->size(), 2u);
  EXPECT_EQ((*files)[0].definition.name, "review");
  EXPECT_EQ((*files)[1].definition.name, "small");
}

TEST_F(PipelineLoaderTest, MissingDirectoryIsEmpty) {
  auto files = PipelineLoader::load_directory(dir_.path() / "absent");
  ASSERT_TRUE(files.has_value());
  EXPECT_TRUE(files->empty());
}
