#pragma once

#include "conductor/core/constants.hpp"

#include <string>
#include <vector>

namespace conductor {

struct RuntimeConfig {
  std::string log_level{"info"};
  // Empty means stdout.
  std::string log_file;
  // 0 selects the built-in shard count.
  int shards{0};
  // 0 selects hardware concurrency.
  int worker_threads{0};

  auto operator==(const RuntimeConfig &) const -> bool = default;
};

struct RateLimitConfig {
  int default_requests_limit{defaults::kRateLimitRequests};
  int window_minutes{static_cast<int>(defaults::kRateLimitWindow.count())};

  auto operator==(const RateLimitConfig &) const -> bool = default;
};

struct PipelineConfig {
  int max_concurrent_executions{defaults::kPipelineConcurrency};
  int execution_timeout_minutes{
      static_cast<int>(defaults::kPipelineTimeout.count())};
  int stats_window_days{static_cast<int>(defaults::kStatsWindow.count())};
  std::string definitions_directory;

  auto operator==(const PipelineConfig &) const -> bool = default;
};

struct AgentConfig {
  int default_max_concurrent_tasks{defaults::kAgentMaxConcurrentTasks};
  int default_timeout_minutes{
      static_cast<int>(defaults::kAgentTimeout.count())};
  int default_max_retries{defaults::kAgentTaskMaxRetries};

  auto operator==(const AgentConfig &) const -> bool = default;
};

struct IngestConfig {
  int max_attempts{defaults::kEventMaxAttempts};
  int retry_backoff_minutes{
      static_cast<int>(defaults::kEventRetryBackoff.count())};
  int retention_days{static_cast<int>(defaults::kEventRetention.count())};
  // Sources accepted without a dedicated handler; their events only start
  // pipelines.
  std::vector<std::string> trigger_sources;

  auto operator==(const IngestConfig &) const -> bool = default;
};

struct MaintenanceConfig {
  int retry_sweep_interval_sec{
      static_cast<int>(timing::kRetrySweepInterval.count())};
  int timeout_check_interval_sec{
      static_cast<int>(timing::kTimeoutCheckInterval.count())};
  int purge_interval_sec{static_cast<int>(timing::kPurgeInterval.count())};

  auto operator==(const MaintenanceConfig &) const -> bool = default;
};

struct SystemConfig {
  RuntimeConfig runtime{};
  RateLimitConfig rate_limit{};
  PipelineConfig pipeline{};
  AgentConfig agent{};
  IngestConfig ingest{};
  MaintenanceConfig maintenance{};

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace conductor
