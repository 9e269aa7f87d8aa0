#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/util/enum.hpp"
#include "conductor/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace conductor {

enum class ProcessingStatus : std::uint8_t {
  Pending,
  Processing,
  Processed,
  Failed,
  Retrying,
};
BOOST_DESCRIBE_ENUM(ProcessingStatus, Pending, Processing, Processed, Failed,
                    Retrying)
CONDUCTOR_DEFINE_ENUM_SERDE(ProcessingStatus, ProcessingStatus::Pending)

[[nodiscard]] constexpr auto is_terminal(ProcessingStatus s) noexcept -> bool {
  return s == ProcessingStatus::Processed || s == ProcessingStatus::Failed;
}

// An event as delivered by an integration, after signature verification.
struct InboundEvent {
  IntegrationId integration;
  std::string source;
  std::string external_event_id;
  std::string event_type;
  // JSON text
  std::string payload{"{}"};
  std::map<std::string, std::string> headers;

  // Accepts {"integrationID", "source", "externalEventID", "eventType",
  // "payload", "headers"}. A missing integration id falls back to the
  // source name.
  [[nodiscard]] static auto from_json(std::string_view text)
      -> Result<InboundEvent>;
};

struct WebhookEvent {
  EventId id;
  TenantId tenant;
  IntegrationId integration;
  std::string source;
  std::string external_event_id;
  std::string event_type;
  std::string payload;
  std::map<std::string, std::string> headers;
  ProcessingStatus status{ProcessingStatus::Pending};
  int processing_attempts{0};
  int max_attempts{defaults::kEventMaxAttempts};
  std::optional<TimePoint> retry_after;
  std::string error_details;
  TimePoint received_at;
  std::optional<TimePoint> processed_at;
};

struct IngestOutcome {
  EventId id;
  bool duplicate{false};
};

struct IngestStats {
  std::size_t pending{0};
  std::size_t processing{0};
  std::size_t processed{0};
  std::size_t failed{0};
  std::size_t retrying{0};

  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return pending + processing + processed + failed + retrying;
  }
};

} // namespace conductor
