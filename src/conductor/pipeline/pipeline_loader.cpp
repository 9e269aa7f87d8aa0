#include "conductor/pipeline/pipeline_loader.hpp"
#include "conductor/config/toml_util.hpp"

#include "conductor/pipeline/step_graph.hpp"
#include "conductor/util/enum.hpp"
#include "conductor/util/log.hpp"

#include <glaze/toml.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {
namespace detail {

struct StepToml {
  std::string name;
  std::string type{"command"};
  std::string command;
  std::string agent_type;
  std::string prompt;
  std::vector<std::string> capabilities;
  std::vector<std::string> depends_on;
  int max_retries{defaults::kStepMaxRetries};
  int priority{defaults::kAgentTaskPriority};
};

struct PipelineToml {
  std::string name;
  std::string description;
  int max_concurrent_executions{0};
  int timeout_minutes{0};
  bool active{true};
  std::vector<std::string> trigger_events;
  std::vector<StepToml> steps;
};

} // namespace detail
} // namespace conductor

namespace glz {
template <> struct meta<conductor::detail::StepToml> {
  using T = conductor::detail::StepToml;
  static constexpr auto value = object(
      "name", &T::name, "type", &T::type, "command", &T::command, "agent_type",
      &T::agent_type, "prompt", &T::prompt, "capabilities", &T::capabilities,
      "depends_on", &T::depends_on, "max_retries", &T::max_retries, "priority",
      &T::priority);
};

template <> struct meta<conductor::detail::PipelineToml> {
  using T = conductor::detail::PipelineToml;
  static constexpr auto value =
      object("name", &T::name, "description", &T::description,
             "max_concurrent_executions", &T::max_concurrent_executions,
             "timeout_minutes", &T::timeout_minutes, "active", &T::active,
             "trigger_events", &T::trigger_events, "steps", &T::steps);
};
} // namespace glz

namespace conductor {
namespace {

auto reject(std::string *diagnostic, std::string message)
    -> std::unexpected<std::error_code> {
  log::error("Pipeline definition error: {}", message);
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
  return fail(Error::InvalidArgument);
}

[[nodiscard]] auto convert_step(detail::StepToml &raw, std::string *diagnostic)
    -> Result<StepTemplate> {
  auto type = util::try_parse_enum<StepType>(raw.type);
  if (!type) {
    return reject(diagnostic, std::format("step '{}': unknown type '{}'",
                                          raw.name, raw.type));
  }
  if (raw.max_retries < 0) {
    return reject(diagnostic,
                  std::format("step '{}': max_retries must be >= 0", raw.name));
  }
  if (*type == StepType::Agent && raw.agent_type.empty()) {
    return reject(diagnostic,
                  std::format("step '{}': agent steps need agent_type",
                              raw.name));
  }
  if (*type == StepType::Agent && (raw.priority < 1 || raw.priority > 5)) {
    return reject(diagnostic, std::format("step '{}': priority must be 1..5",
                                          raw.name));
  }
  return ok(StepTemplate{.name = std::move(raw.name),
                         .type = *type,
                         .depends_on = std::move(raw.depends_on),
                         .max_retries = raw.max_retries,
                         .command = std::move(raw.command),
                         .agent_type = std::move(raw.agent_type),
                         .prompt = std::move(raw.prompt),
                         .capabilities = std::move(raw.capabilities),
                         .priority = raw.priority});
}

[[nodiscard]] auto parse_definition(std::string_view text,
                                    std::string *diagnostic)
    -> Result<PipelineDefinition> {
  auto raw_result = toml_util::parse_toml<detail::PipelineToml>(text, diagnostic);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  if (raw.name.empty()) {
    return reject(diagnostic, "pipeline name must not be empty");
  }
  if (raw.steps.empty()) {
    return reject(diagnostic,
                  std::format("pipeline '{}' declares no steps", raw.name));
  }
  if (raw.max_concurrent_executions < 0 || raw.timeout_minutes < 0) {
    return reject(diagnostic,
                  std::format("pipeline '{}': limits must not be negative",
                              raw.name));
  }

  PipelineDefinition def;
  def.name = std::move(raw.name);
  def.description = std::move(raw.description);
  def.active = raw.active;
  def.trigger_events = std::move(raw.trigger_events);
  def.max_concurrent_executions = raw.max_concurrent_executions;
  def.timeout = std::chrono::minutes(raw.timeout_minutes);
  def.steps.reserve(raw.steps.size());
  for (auto &step : raw.steps) {
    auto converted = convert_step(step, diagnostic);
    if (!converted) {
      return fail(converted.error());
    }
    def.steps.push_back(std::move(*converted));
  }

  if (auto graph = StepGraph::build(def.steps, diagnostic); !graph) {
    log::error("Pipeline '{}' has an invalid step graph: {}", def.name,
               graph.error().message());
    return fail(graph.error());
  }
  return ok(std::move(def));
}

} // namespace

auto PipelineLoader::load_from_file(std::string_view path,
                                    std::string *diagnostic)
    -> Result<PipelineDefinition> {
  auto text = toml_util::read_file(path);
  if (!text) {
    if (diagnostic) {
      *diagnostic = text.error().message();
    }
    return fail(text.error());
  }
  return load_from_string(*text, diagnostic);
}

auto PipelineLoader::load_from_string(std::string_view toml_str,
                                      std::string *diagnostic)
    -> Result<PipelineDefinition> {
  try {
    return parse_definition(toml_str, diagnostic);
  } catch (const std::exception &e) {
    log::error("TOML parse error: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

auto PipelineLoader::load_directory(const std::filesystem::path &directory)
    -> Result<std::vector<PipelineFile>> {
  std::error_code ec;
  if (!std::filesystem::exists(directory, ec)) {
    log::warn("Pipeline directory does not exist: {}", directory.string());
    return ok(std::vector<PipelineFile>{});
  }

  auto canonical_dir = std::filesystem::canonical(directory, ec);
  if (ec) {
    return fail(Error::FileNotFound);
  }

  std::vector<std::filesystem::path> candidates;
  for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".toml") {
      candidates.push_back(entry.path());
    }
  }
  if (ec) {
    log::error("Cannot list pipeline directory {}: {}", directory.string(),
               ec.message());
    return fail(Error::FileNotFound);
  }
  std::ranges::sort(candidates);

  std::vector<PipelineFile> files;
  for (const auto &path : candidates) {
    auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
      continue;
    }
    auto [iter, _] = std::mismatch(canonical_dir.begin(), canonical_dir.end(),
                                   canonical_path.begin(),
                                   canonical_path.end());
    if (iter != canonical_dir.end()) {
      log::warn("Skipping file outside pipeline directory: {}",
                path.string());
      continue;
    }

    std::string diagnostic;
    auto result = load_from_file(path.string(), &diagnostic);
    if (!result) {
      log::warn("Failed to load pipeline from {}: {}", path.string(),
                diagnostic.empty() ? result.error().message() : diagnostic);
      continue;
    }
    log::info("Loaded pipeline '{}' from {}", result->name, path.string());
    files.push_back(PipelineFile{.path = path, .definition = std::move(*result)});
  }

  log::info("Loaded {} pipeline(s) from {}", files.size(), directory.string());
  return ok(std::move(files));
}

} // namespace conductor
