#include "conductor/config/config.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdlib>
#include <string>

using namespace conductor;

namespace {

class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

  ScopedEnv(const ScopedEnv &) = delete;
  auto operator=(const ScopedEnv &) -> ScopedEnv & = delete;

private:
  const char *name_;
};

} // namespace

TEST(ConfigTest, RuntimeDefaults) {
  RuntimeConfig cfg;
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_TRUE(cfg.log_file.empty());
  EXPECT_EQ(cfg.shards, 0);
  EXPECT_EQ(cfg.worker_threads, 0);
}

TEST(ConfigTest, ComponentDefaults) {
  SystemConfig cfg;
  EXPECT_EQ(cfg.rate_limit.default_requests_limit, 1000);
  EXPECT_EQ(cfg.rate_limit.window_minutes, 60);
  EXPECT_EQ(cfg.pipeline.max_concurrent_executions, 3);
  EXPECT_EQ(cfg.pipeline.execution_timeout_minutes, 60);
  EXPECT_EQ(cfg.agent.default_max_concurrent_tasks, 5);
  EXPECT_EQ(cfg.agent.default_timeout_minutes, 30);
  EXPECT_EQ(cfg.agent.default_max_retries, 3);
  EXPECT_EQ(cfg.ingest.max_attempts, 3);
  EXPECT_EQ(cfg.ingest.retry_backoff_minutes, 5);
  EXPECT_EQ(cfg.ingest.retention_days, 90);
  EXPECT_EQ(cfg.maintenance.retry_sweep_interval_sec, 30);
  EXPECT_EQ(cfg.maintenance.timeout_check_interval_sec, 60);
  EXPECT_EQ(cfg.maintenance.purge_interval_sec, 3600);
}

TEST(ConfigTest, EmptySectionYieldsDefaults) {
  auto result = ConfigLoader::load_from_string("[runtime]\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(*result, SystemConfig{});
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[runtime]
log_level = "debug"
shards = 8
worker_threads = 2

[rate_limit]
default_requests_limit = 50
window_minutes = 1

[pipeline]
max_concurrent_executions = 10
execution_timeout_minutes = 15
definitions_directory = "./pipelines"

[agent]
default_max_concurrent_tasks = 2
default_max_retries = 0

[ingest]
max_attempts = 5
retry_backoff_minutes = 1
trigger_sources = ["github", "linear"]

[maintenance]
purge_interval_sec = 600
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->runtime.log_level, "debug");
  EXPECT_EQ(result->runtime.shards, 8);
  EXPECT_EQ(result->runtime.worker_threads, 2);
  EXPECT_EQ(result->rate_limit.default_requests_limit, 50);
  EXPECT_EQ(result->rate_limit.window_minutes, 1);
  EXPECT_EQ(result->pipeline.max_concurrent_executions, 10);
  EXPECT_EQ(result->pipeline.execution_timeout_minutes, 15);
  EXPECT_EQ(result->pipeline.definitions_directory, "./pipelines");
  EXPECT_EQ(result->agent.default_max_concurrent_tasks, 2);
  EXPECT_EQ(result->agent.default_timeout_minutes, 30);
  EXPECT_EQ(result->agent.default_max_retries, 0);
  EXPECT_EQ(result->ingest.max_attempts, 5);
  ASSERT_EQ(result->ingest.trigger_sources.size(), 2u);
  EXPECT_EQ(result->ingest.trigger_sources[1], "linear");
  EXPECT_EQ(result->maintenance.purge_interval_sec, 600);
  EXPECT_EQ(result->maintenance.retry_sweep_interval_sec, 30);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto result = ConfigLoader::load_from_string(R"(
[runtime]
log_level = "warn"
colour = true

[future_section]
value = 1
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->runtime.log_level, "warn");
}

TEST(ConfigTest, OutOfRangeValuesRejected) {
  auto result = ConfigLoader::load_from_string(R"(
[pipeline]
max_concurrent_executions = 0
)");
  EXPECT_TRUE(test::is_error(result, Error::InvalidArgument));

  result = ConfigLoader::load_from_string(R"(
[agent]
default_max_retries = -1
)");
  EXPECT_TRUE(test::is_error(result, Error::InvalidArgument));
}

TEST(ConfigTest, MalformedTomlRejected) {
  auto result = ConfigLoader::load_from_string("[runtime\nlog_level = ");
  EXPECT_TRUE(test::is_error(result, Error::ParseError));
}

TEST(ConfigTest, MissingFileRejected) {
  auto result = ConfigLoader::load_from_file("/nonexistent/conductor.toml");
  EXPECT_TRUE(test::is_error(result, Error::FileNotFound));
}

TEST(ConfigTest, LoadFromFile) {
  test::TempDir dir;
  auto path = dir.write("conductor.toml", "[ingest]\nretention_days = 7\n");
  auto result = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->ingest.retention_days, 7);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  ScopedEnv level("CONDUCTOR_LOG_LEVEL", "error");
  ScopedEnv limit("CONDUCTOR_RATE_LIMIT_REQUESTS", "25");
  ScopedEnv dir("CONDUCTOR_PIPELINE_DIRECTORY", "/srv/pipelines");

  auto result = ConfigLoader::load_from_string(R"(
[runtime]
log_level = "debug"

[rate_limit]
default_requests_limit = 50
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->runtime.log_level, "error");
  EXPECT_EQ(result->rate_limit.default_requests_limit, 25);
  EXPECT_EQ(result->pipeline.definitions_directory, "/srv/pipelines");
}

TEST(ConfigTest, BadEnvironmentOverrideIsParseError) {
  ScopedEnv shards("CONDUCTOR_SHARDS", "many");
  auto result = ConfigLoader::load_from_string("[runtime]\n");
  EXPECT_TRUE(test::is_error(result, Error::ParseError));
}
