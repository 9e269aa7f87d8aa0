#include "conductor/config/config.hpp"
#include "conductor/config/toml_util.hpp"

#include "conductor/core/error.hpp"
#include "conductor/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {
namespace detail {

struct RuntimeToml {
  std::string log_level{"info"};
  std::string log_file;
  int shards{0};
  int worker_threads{0};
};

struct RateLimitToml {
  int default_requests_limit{defaults::kRateLimitRequests};
  int window_minutes{static_cast<int>(defaults::kRateLimitWindow.count())};
};

struct PipelineToml {
  int max_concurrent_executions{defaults::kPipelineConcurrency};
  int execution_timeout_minutes{
      static_cast<int>(defaults::kPipelineTimeout.count())};
  int stats_window_days{static_cast<int>(defaults::kStatsWindow.count())};
  std::string definitions_directory;
};

struct AgentToml {
  int default_max_concurrent_tasks{defaults::kAgentMaxConcurrentTasks};
  int default_timeout_minutes{
      static_cast<int>(defaults::kAgentTimeout.count())};
  int default_max_retries{defaults::kAgentTaskMaxRetries};
};

struct IngestToml {
  int max_attempts{defaults::kEventMaxAttempts};
  int retry_backoff_minutes{
      static_cast<int>(defaults::kEventRetryBackoff.count())};
  int retention_days{static_cast<int>(defaults::kEventRetention.count())};
  std::vector<std::string> trigger_sources;
};

struct MaintenanceToml {
  int retry_sweep_interval_sec{
      static_cast<int>(timing::kRetrySweepInterval.count())};
  int timeout_check_interval_sec{
      static_cast<int>(timing::kTimeoutCheckInterval.count())};
  int purge_interval_sec{static_cast<int>(timing::kPurgeInterval.count())};
};

struct SystemToml {
  RuntimeToml runtime{};
  RateLimitToml rate_limit{};
  PipelineToml pipeline{};
  AgentToml agent{};
  IngestToml ingest{};
  MaintenanceToml maintenance{};
};

} // namespace detail
} // namespace conductor

namespace glz {
template <> struct meta<conductor::detail::RuntimeToml> {
  using T = conductor::detail::RuntimeToml;
  static constexpr auto value =
      object("log_level", &T::log_level, "log_file", &T::log_file, "shards",
             &T::shards, "worker_threads", &T::worker_threads);
};

template <> struct meta<conductor::detail::RateLimitToml> {
  using T = conductor::detail::RateLimitToml;
  static constexpr auto value =
      object("default_requests_limit", &T::default_requests_limit,
             "window_minutes", &T::window_minutes);
};

template <> struct meta<conductor::detail::PipelineToml> {
  using T = conductor::detail::PipelineToml;
  static constexpr auto value =
      object("max_concurrent_executions", &T::max_concurrent_executions,
             "execution_timeout_minutes", &T::execution_timeout_minutes,
             "stats_window_days", &T::stats_window_days,
             "definitions_directory", &T::definitions_directory);
};

template <> struct meta<conductor::detail::AgentToml> {
  using T = conductor::detail::AgentToml;
  static constexpr auto value =
      object("default_max_concurrent_tasks", &T::default_max_concurrent_tasks,
             "default_timeout_minutes", &T::default_timeout_minutes,
             "default_max_retries", &T::default_max_retries);
};

template <> struct meta<conductor::detail::IngestToml> {
  using T = conductor::detail::IngestToml;
  static constexpr auto value =
      object("max_attempts", &T::max_attempts, "retry_backoff_minutes",
             &T::retry_backoff_minutes, "retention_days", &T::retention_days,
             "trigger_sources", &T::trigger_sources);
};

template <> struct meta<conductor::detail::MaintenanceToml> {
  using T = conductor::detail::MaintenanceToml;
  static constexpr auto value =
      object("retry_sweep_interval_sec", &T::retry_sweep_interval_sec,
             "timeout_check_interval_sec", &T::timeout_check_interval_sec,
             "purge_interval_sec", &T::purge_interval_sec);
};

template <> struct meta<conductor::detail::SystemToml> {
  using T = conductor::detail::SystemToml;
  static constexpr auto value =
      object("runtime", &T::runtime, "rate_limit", &T::rate_limit, "pipeline",
             &T::pipeline, "agent", &T::agent, "ingest", &T::ingest,
             "maintenance", &T::maintenance);
};
} // namespace glz

namespace conductor {
namespace {

template <typename T>
auto env_override(const char *name, T &target) -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    target = boost::lexical_cast<T>(v);
  }
}

auto env_override(const char *name, std::string &target) -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    target = v;
  }
}

[[nodiscard]] auto validate(const SystemConfig &cfg) -> bool {
  const auto &m = cfg.maintenance;
  return cfg.runtime.shards >= 0 && cfg.runtime.worker_threads >= 0 &&
         cfg.rate_limit.default_requests_limit > 0 &&
         cfg.rate_limit.window_minutes > 0 &&
         cfg.pipeline.max_concurrent_executions > 0 &&
         cfg.pipeline.execution_timeout_minutes > 0 &&
         cfg.pipeline.stats_window_days > 0 &&
         cfg.agent.default_max_concurrent_tasks > 0 &&
         cfg.agent.default_timeout_minutes > 0 &&
         cfg.agent.default_max_retries >= 0 && cfg.ingest.max_attempts > 0 &&
         cfg.ingest.retry_backoff_minutes >= 0 &&
         cfg.ingest.retention_days > 0 && m.retry_sweep_interval_sec > 0 &&
         m.timeout_check_interval_sec > 0 && m.purge_interval_sec > 0;
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.runtime.log_level = std::move(raw.runtime.log_level);
  cfg.runtime.log_file = std::move(raw.runtime.log_file);
  cfg.runtime.shards = raw.runtime.shards;
  cfg.runtime.worker_threads = raw.runtime.worker_threads;

  cfg.rate_limit.default_requests_limit =
      raw.rate_limit.default_requests_limit;
  cfg.rate_limit.window_minutes = raw.rate_limit.window_minutes;

  cfg.pipeline.max_concurrent_executions =
      raw.pipeline.max_concurrent_executions;
  cfg.pipeline.execution_timeout_minutes =
      raw.pipeline.execution_timeout_minutes;
  cfg.pipeline.stats_window_days = raw.pipeline.stats_window_days;
  cfg.pipeline.definitions_directory =
      std::move(raw.pipeline.definitions_directory);

  cfg.agent.default_max_concurrent_tasks =
      raw.agent.default_max_concurrent_tasks;
  cfg.agent.default_timeout_minutes = raw.agent.default_timeout_minutes;
  cfg.agent.default_max_retries = raw.agent.default_max_retries;

  cfg.ingest.max_attempts = raw.ingest.max_attempts;
  cfg.ingest.retry_backoff_minutes = raw.ingest.retry_backoff_minutes;
  cfg.ingest.retention_days = raw.ingest.retention_days;
  cfg.ingest.trigger_sources = std::move(raw.ingest.trigger_sources);

  cfg.maintenance.retry_sweep_interval_sec =
      raw.maintenance.retry_sweep_interval_sec;
  cfg.maintenance.timeout_check_interval_sec =
      raw.maintenance.timeout_check_interval_sec;
  cfg.maintenance.purge_interval_sec = raw.maintenance.purge_interval_sec;

  env_override("CONDUCTOR_LOG_LEVEL", cfg.runtime.log_level);
  env_override("CONDUCTOR_LOG_FILE", cfg.runtime.log_file);
  env_override("CONDUCTOR_SHARDS", cfg.runtime.shards);
  env_override("CONDUCTOR_WORKER_THREADS", cfg.runtime.worker_threads);
  env_override("CONDUCTOR_RATE_LIMIT_REQUESTS",
               cfg.rate_limit.default_requests_limit);
  env_override("CONDUCTOR_RATE_LIMIT_WINDOW_MINUTES",
               cfg.rate_limit.window_minutes);
  env_override("CONDUCTOR_PIPELINE_MAX_CONCURRENT",
               cfg.pipeline.max_concurrent_executions);
  env_override("CONDUCTOR_PIPELINE_TIMEOUT_MINUTES",
               cfg.pipeline.execution_timeout_minutes);
  env_override("CONDUCTOR_PIPELINE_DIRECTORY",
               cfg.pipeline.definitions_directory);
  env_override("CONDUCTOR_AGENT_MAX_CONCURRENT",
               cfg.agent.default_max_concurrent_tasks);
  env_override("CONDUCTOR_AGENT_TIMEOUT_MINUTES",
               cfg.agent.default_timeout_minutes);
  env_override("CONDUCTOR_AGENT_MAX_RETRIES", cfg.agent.default_max_retries);
  env_override("CONDUCTOR_INGEST_MAX_ATTEMPTS", cfg.ingest.max_attempts);
  env_override("CONDUCTOR_INGEST_RETENTION_DAYS", cfg.ingest.retention_days);

  if (!validate(cfg)) {
    log::error("System configuration contains out-of-range values");
    return fail(Error::InvalidArgument);
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read configuration file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid CONDUCTOR_* environment override: {}", e.what());
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace conductor
