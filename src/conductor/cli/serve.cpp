#include "conductor/app/maintenance_service.hpp"
#include "conductor/app/orchestrator.hpp"
#include "conductor/cli/commands.hpp"
#include "conductor/config/config.hpp"
#include "conductor/util/log.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <print>
#include <string>
#include <thread>
#include <vector>

namespace conductor::cli {
namespace {

auto load_config_or_print(std::string_view path) -> Result<Config> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<Config> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

auto resolve_relative_to(const std::string &config_file,
                         const std::string &directory) -> std::string {
  std::filesystem::path dir{directory};
  if (dir.is_absolute()) {
    return directory;
  }
  auto base = std::filesystem::absolute(config_file).parent_path();
  return std::filesystem::weakly_canonical(base / dir).string();
}

} // namespace

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    config.runtime.log_level = *opts.log_level;
  }
  if (opts.worker_threads.has_value()) {
    config.runtime.worker_threads = *opts.worker_threads;
  }
  const auto log_file = opts.log_file.value_or(config.runtime.log_file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  log::set_level(config.runtime.log_level);
  log::start();

  const auto threads = static_cast<std::size_t>(
      config.runtime.worker_threads > 0
          ? config.runtime.worker_threads
          : std::max(1u, std::thread::hardware_concurrency()));

  boost::asio::io_context ctx{static_cast<int>(threads)};
  auto work = boost::asio::make_work_guard(ctx);
  const TenantId tenant{opts.tenant};

  Orchestrator orchestrator(ctx.get_executor(), system_clock(), config);
  if (!config.pipeline.definitions_directory.empty()) {
    auto dir = resolve_relative_to(opts.config_file,
                                   config.pipeline.definitions_directory);
    auto loaded = orchestrator.load_pipelines(tenant, dir);
    if (!loaded) {
      log::error("Failed to load pipelines from {}: {}", dir,
                 loaded.error().message());
      log::stop();
      return 1;
    }
    log::info("Registered {} pipeline(s) for tenant {}", *loaded, tenant);
  }

  MaintenanceService maintenance(ctx.get_executor(), orchestrator);
  maintenance.start();

  boost::asio::signal_set signals(ctx, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (ec) {
      return;
    }
    log::info("Received signal {}, shutting down", signo);
    maintenance.stop();
    work.reset();
    ctx.stop();
  });

  log::info("Conductor started with {} worker thread(s)", threads);
  {
    std::vector<std::jthread> workers;
    workers.reserve(threads - 1);
    for (std::size_t i = 1; i < threads; ++i) {
      workers.emplace_back([&ctx] { ctx.run(); });
    }
    ctx.run();
  }

  maintenance.flush_notifications();
  log::info("Conductor stopped.");
  log::stop();
  return 0;
}

} // namespace conductor::cli
