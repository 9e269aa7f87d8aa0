#pragma once

#include <optional>
#include <string>
#include <vector>

namespace conductor::cli {

struct ValidateOptions {
  std::string config_file;
  // Pipeline files to check; empty means the configured directory.
  std::vector<std::string> files;
  bool json{false};
};

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<int> worker_threads;
  std::string tenant{"default"};
};

struct ReplayOptions {
  std::string config_file;
  std::string events_file;
  std::string tenant{"default"};
  bool json{false};
};

auto cmd_validate(const ValidateOptions &opts) -> int;
auto cmd_serve(const ServeOptions &opts) -> int;
auto cmd_replay(const ReplayOptions &opts) -> int;

} // namespace conductor::cli
