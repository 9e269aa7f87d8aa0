#include "conductor/cli/commands.hpp"
#include "conductor/cli/formatting.hpp"
#include "conductor/config/config.hpp"
#include "conductor/pipeline/pipeline_loader.hpp"
#include "conductor/util/json.hpp"
#include "conductor/util/log.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <print>
#include <string>
#include <vector>

namespace conductor::cli {

namespace {

struct ValidationResult {
  std::string pipeline;
  std::string file_path;
  std::size_t steps{0};
  bool valid{false};
  std::string error;
};

auto validate_single_file(const std::filesystem::path &path)
    -> ValidationResult {
  ValidationResult vr{.pipeline = path.stem().string(),
                      .file_path = path.string(),
                      .steps = 0,
                      .valid = false,
                      .error = {}};

  std::string diagnostic;
  auto res = PipelineLoader::load_from_file(path.string(), &diagnostic);
  vr.valid = res.has_value();
  if (vr.valid) {
    vr.pipeline = res->name;
    vr.steps = res->steps.size();
  } else {
    vr.error = diagnostic.empty() ? res.error().message() : diagnostic;
  }
  return vr;
}

auto resolve_directory(const std::string &config_file,
                       const std::string &directory) -> std::filesystem::path {
  std::filesystem::path dir{directory};
  if (dir.is_absolute()) {
    return dir;
  }
  auto base = std::filesystem::absolute(config_file).parent_path();
  return std::filesystem::weakly_canonical(base / dir);
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();

  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: invalid config {}: {}", opts.config_file,
                 config_res.error().message());
    return 1;
  }

  std::vector<std::filesystem::path> files(opts.files.begin(),
                                           opts.files.end());
  if (files.empty()) {
    const auto &configured = config_res->pipeline.definitions_directory;
    if (configured.empty()) {
      if (!opts.json) {
        std::println("Config OK; no pipeline directory configured");
      }
      return 0;
    }
    auto dir = resolve_directory(opts.config_file, configured);
    if (!std::filesystem::exists(dir)) {
      std::println(stderr, "Error: Directory does not exist: {}", dir.string());
      return 1;
    }
    for (const auto &entry : std::filesystem::directory_iterator(dir)) {
      if (entry.is_regular_file() && entry.path().extension() == ".toml") {
        files.push_back(entry.path());
      }
    }
    std::ranges::sort(files);
  }

  std::vector<ValidationResult> results;
  for (const auto &file : files) {
    if (!std::filesystem::exists(file)) {
      results.push_back(ValidationResult{.pipeline = file.stem().string(),
                                         .file_path = file.string(),
                                         .steps = 0,
                                         .valid = false,
                                         .error = "file does not exist"});
      continue;
    }
    results.push_back(validate_single_file(file));
  }

  const auto invalid_count = static_cast<std::int64_t>(
      std::ranges::count(results, false, &ValidationResult::valid));
  const auto valid_count =
      static_cast<std::int64_t>(results.size()) - invalid_count;

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &vr : results) {
      JsonValue obj{
          {"pipeline", vr.pipeline},
          {"file", vr.file_path},
          {"steps", static_cast<std::int64_t>(vr.steps)},
          {"valid", vr.valid},
      };
      if (!vr.valid) {
        obj.get_object().emplace("error", vr.error);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    JsonValue output{
        {"config", opts.config_file},
        {"results", std::move(arr)},
        {"summary",
         JsonValue{
             {"valid", valid_count},
             {"invalid", invalid_count},
             {"total", static_cast<std::int64_t>(results.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    std::println("Config OK: {}\n", opts.config_file);
    for (const auto &vr : results) {
      if (vr.valid) {
        std::println("{} {} - {} ({} steps)", fmt::ansi::green("\u2713"),
                     vr.pipeline, fmt::ansi::green("Valid"), vr.steps);
      } else {
        std::println("{} {} - {}", fmt::ansi::red("\u2717"), vr.file_path,
                     fmt::ansi::red(vr.error));
      }
    }
    std::println("\nSummary: {} valid, {} invalid", valid_count,
                 invalid_count);
  }

  return invalid_count > 0 ? 1 : 0;
}

} // namespace conductor::cli
