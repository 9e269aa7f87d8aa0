#include "conductor/ingest/webhook_event.hpp"

#include "conductor/util/json.hpp"

#include <utility>

namespace conductor {

auto InboundEvent::from_json(std::string_view text) -> Result<InboundEvent> {
  auto parsed = parse_json(text);
  if (!parsed) {
    return fail(parsed.error());
  }
  const auto &root = *parsed;
  if (!root.is_object()) {
    return fail(Error::ParseError);
  }

  auto source = json_string(root, "source");
  auto external_id = json_string(root, "externalEventID");
  auto event_type = json_string(root, "eventType");
  if (!source || source->empty() || !external_id || external_id->empty() ||
      !event_type || event_type->empty()) {
    return fail(Error::InvalidArgument);
  }

  InboundEvent event;
  event.integration =
      IntegrationId{json_string(root, "integrationID").value_or(*source)};
  event.source = std::move(*source);
  event.external_event_id = std::move(*external_id);
  event.event_type = std::move(*event_type);

  const auto &obj = root.get_object();
  if (auto it = obj.find("payload"); it != obj.end()) {
    event.payload = dump_json(it->second);
  }
  if (auto it = obj.find("headers"); it != obj.end()) {
    if (!it->second.is_object()) {
      return fail(Error::InvalidArgument);
    }
    for (const auto &[name, value] : it->second.get_object()) {
      if (value.is_string()) {
        event.headers.emplace(name, value.as<std::string>());
      }
    }
  }
  return ok(std::move(event));
}

} // namespace conductor
