#include "conductor/cli/commands.hpp"
#include "conductor/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("CONDUCTOR_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  conductor::log::set_output_stderr();
  conductor::log::set_level(conductor::log::Level::Warn);

  CLI::App app{"Conductor", "Task, pipeline and agent orchestration engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  conductor validate -c conductor.toml\n"
             "  conductor serve -c conductor.toml\n"
             "  conductor replay -c conductor.toml events.jsonl\n"
             "\nTip: Set CONDUCTOR_CONFIG=conductor.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  conductor::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check the system config and pipeline definition files");
  validate_opts.config_file = env_config;
  auto *validate_cfg =
      validate
          ->add_option("-c,--config", validate_opts.config_file,
                       "System config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    validate_cfg->required();
  validate->add_option("pipelines", validate_opts.files,
                       "Pipeline files (default: configured directory)");
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(conductor::cli::cmd_validate(validate_opts));
  });

  conductor::cli::ServeOptions serve_opts;
  auto *serve =
      app.add_subcommand("serve", "Run the orchestrator until SIGINT/SIGTERM");
  serve_opts.config_file = env_config;
  auto *serve_cfg = serve
                        ->add_option("-c,--config", serve_opts.config_file,
                                     "System config file")
                        ->check(CLI::ExistingFile);
  if (env_config.empty())
    serve_cfg->required();
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_option("--threads", serve_opts.worker_threads,
                    "Worker threads (default: CPU cores)")
      ->check(CLI::PositiveNumber);
  serve->add_option("--tenant", serve_opts.tenant,
                    "Tenant that owns the loaded pipelines");
  serve->callback(
      [&serve_opts]() { std::exit(conductor::cli::cmd_serve(serve_opts)); });

  conductor::cli::ReplayOptions replay_opts;
  auto *replay = app.add_subcommand(
      "replay", "Ingest a JSON-lines file of events and report the outcome");
  replay_opts.config_file = env_config;
  auto *replay_cfg = replay
                         ->add_option("-c,--config", replay_opts.config_file,
                                      "System config file")
                         ->check(CLI::ExistingFile);
  if (env_config.empty())
    replay_cfg->required();
  replay->add_option("events", replay_opts.events_file, "Events file (.jsonl)")
      ->required()
      ->check(CLI::ExistingFile);
  replay->add_option("--tenant", replay_opts.tenant, "Tenant to ingest as");
  replay->add_flag("--json", replay_opts.json, "Output JSON");
  replay->callback(
      [&replay_opts]() { std::exit(conductor::cli::cmd_replay(replay_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
