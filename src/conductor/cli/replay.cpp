#include "conductor/app/orchestrator.hpp"
#include "conductor/cli/commands.hpp"
#include "conductor/cli/formatting.hpp"
#include "conductor/config/config.hpp"
#include "conductor/util/json.hpp"
#include "conductor/util/log.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <format>
#include <fstream>
#include <print>
#include <string>
#include <utility>
#include <vector>

namespace conductor::cli {
namespace {

struct ReplayLine {
  std::size_t line{0};
  std::string external_id;
  std::string source;
  std::string outcome;
  std::string detail;
};

} // namespace

auto cmd_replay(const ReplayOptions &opts) -> int {
  log::set_output_stderr();

  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  std::ifstream in(opts.events_file);
  if (!in) {
    std::println(stderr, "Error: cannot open {}", opts.events_file);
    return 1;
  }

  boost::asio::io_context ctx;
  const TenantId tenant{opts.tenant};
  Orchestrator orchestrator(ctx.get_executor(), system_clock(), *config_res);

  std::vector<ReplayLine> lines;
  std::vector<std::pair<std::size_t, EventId>> accepted;
  std::string text;
  std::size_t line_no = 0;
  while (std::getline(in, text)) {
    ++line_no;
    if (text.empty() || text.front() == '#') {
      continue;
    }
    ReplayLine row{.line = line_no};
    auto event = InboundEvent::from_json(text);
    if (!event) {
      row.outcome = "rejected";
      row.detail = event.error().message();
      lines.push_back(std::move(row));
      continue;
    }
    row.external_id = event->external_event_id;
    row.source = event->source;

    auto outcome = orchestrator.ingest(tenant, std::move(*event));
    if (!outcome) {
      row.outcome = "rejected";
      row.detail = outcome.error().message();
    } else if (outcome->duplicate) {
      row.outcome = "duplicate";
      row.detail = outcome->id.str();
    } else {
      accepted.emplace_back(lines.size(), outcome->id);
      row.outcome = "accepted";
    }
    lines.push_back(std::move(row));
    // Process each event before reading the next so later events can see
    // tasks created by earlier ones.
    ctx.run();
    ctx.restart();
  }

  for (const auto &[index, id] : accepted) {
    auto event = orchestrator.ingestion().get_event(tenant, id);
    if (!event) {
      continue;
    }
    auto &row = lines[index];
    row.outcome = std::string(to_string_view(event->status));
    row.detail = event->error_details.empty() ? id.str() : event->error_details;
  }

  const auto notifications = orchestrator.outbox().drain();
  const auto stats = orchestrator.ingestion().stats(tenant);

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (const auto &row : lines) {
      arr.get_array().emplace_back(JsonValue{
          {"line", static_cast<std::int64_t>(row.line)},
          {"external_event_id", row.external_id},
          {"source", row.source},
          {"outcome", row.outcome},
          {"detail", row.detail},
      });
    }
    JsonValue output{
        {"events", std::move(arr)},
        {"summary",
         JsonValue{
             {"processed", static_cast<std::int64_t>(stats.processed)},
             {"failed", static_cast<std::int64_t>(stats.failed)},
             {"retrying", static_cast<std::int64_t>(stats.retrying)},
             {"notifications", static_cast<std::int64_t>(notifications.size())},
         }},
    };
    std::println("{}", dump_json(output));
  } else {
    fmt::Table table({{"LINE", 6, true},
                      {"EXTERNAL ID", 24},
                      {"SOURCE", 14},
                      {"OUTCOME", 12},
                      {"DETAIL", 40}});
    table.print_header();
    for (const auto &row : lines) {
      table.print_row({std::to_string(row.line), row.external_id, row.source,
                       fmt::colorize_status(row.outcome), row.detail});
    }
    std::println("\n{} processed, {} failed, {} retrying, {} notification(s)",
                 stats.processed, stats.failed, stats.retrying,
                 notifications.size());
  }
  return stats.failed > 0 ? 1 : 0;
}

} // namespace conductor::cli
