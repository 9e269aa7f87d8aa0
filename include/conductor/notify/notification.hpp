#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/util/enum.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/json.hpp"
#include "conductor/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace conductor {

enum class NotificationType : std::uint8_t {
  PipelineFailed,
  RateLimit,
  AuthExpired,
  WebhookFailed,
  SyncError,
  AgentTaskFailed,
  HierarchyCorruption,
};
BOOST_DESCRIBE_ENUM(NotificationType, PipelineFailed, RateLimit, AuthExpired,
                    WebhookFailed, SyncError, AgentTaskFailed,
                    HierarchyCorruption)
CONDUCTOR_DEFINE_ENUM_SERDE(NotificationType, NotificationType::SyncError)

struct NotificationSubscription {
  NotificationId id;
  TenantId tenant;
  // Unset matches events of every integration.
  std::optional<IntegrationId> integration;
  NotificationType type{NotificationType::SyncError};
  // Opaque JSON describing the delivery target (channel, url, address).
  std::string target_config;
  bool active{true};
  std::int64_t trigger_count{0};
  std::optional<TimePoint> last_triggered_at;
};

// What the core reports; the outbox fans it out to subscriptions.
struct NotificationEvent {
  TenantId tenant;
  std::optional<IntegrationId> integration;
  NotificationType type{NotificationType::SyncError};
  std::string message;
  // JSON object text with type-specific detail.
  std::string details;
};

struct NotificationRecord {
  NotificationId id;
  TenantId tenant;
  std::optional<IntegrationId> integration;
  std::optional<NotificationId> subscription;
  NotificationType type{NotificationType::SyncError};
  // Empty when no subscription matched.
  std::string target_config;
  std::string message;
  std::string details;
  TimePoint triggered_at;

  [[nodiscard]] auto to_json() const -> std::string {
    JsonValue j = {
        {"id", id.str()},
        {"tenant_id", tenant.str()},
        {"integration_id", integration ? integration->str() : std::string{}},
        {"subscription_id", subscription ? subscription->str() : std::string{}},
        {"type", std::string(to_string_view(type))},
        {"target_config", target_config},
        {"message", message},
        {"details", details},
        {"triggered_at", util::format_iso8601(triggered_at)}};
    return dump_json(j);
  }
};

} // namespace conductor
