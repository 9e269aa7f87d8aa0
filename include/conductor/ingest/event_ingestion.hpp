#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/ingest/rate_limiter.hpp"
#include "conductor/ingest/webhook_event.hpp"
#include "conductor/notify/notification_outbox.hpp"
#include "conductor/util/hash.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/sharded_map.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace conductor {

using EventHandler =
    std::move_only_function<Result<void>(const WebhookEvent &) const>;

struct EventIngestionOptions {
  int max_attempts{defaults::kEventMaxAttempts};
  // Retry delay is attempts * retry_backoff.
  std::chrono::seconds retry_backoff{defaults::kEventRetryBackoff};
};

struct IngestionCallbacks {
  std::move_only_function<void(const WebhookEvent &)> on_processed;
  // Permanent failure only.
  std::move_only_function<void(const WebhookEvent &)> on_failed;
};

// Idempotent intake of integration events. Each event is handed to the
// handler registered for its source; failures are retried with a linear
// backoff until max_attempts, then parked as failed.
//
// Lock order: dedup shard, then rate limiter, then event shard. Handlers
// run without any lock held.
class EventIngestionPipeline {
public:
  EventIngestionPipeline(const Clock &clock, RateLimiter &limiter,
                         NotificationOutbox *outbox = nullptr,
                         EventIngestionOptions options = {},
                         std::size_t shards = defaults::kShardCount);

  EventIngestionPipeline(const EventIngestionPipeline &) = delete;
  auto operator=(const EventIngestionPipeline &)
      -> EventIngestionPipeline & = delete;

  auto set_callbacks(IngestionCallbacks callbacks) -> void;
  auto register_handler(std::string source, EventHandler handler) -> void;
  [[nodiscard]] auto has_handler(std::string_view source) const -> bool;

  // A repeated (integration, external id) is a successful no-op that
  // reports the original event id.
  [[nodiscard]] auto ingest(const TenantId &tenant, InboundEvent event)
      -> Result<IngestOutcome>;

  // Runs one pending or retrying event through its handler.
  [[nodiscard]] auto process(const TenantId &tenant, const EventId &id)
      -> Result<ProcessingStatus>;
  // Re-processes retrying events whose retry_after has elapsed.
  auto sweep_retries(TimePoint now) -> std::size_t;
  // Processes up to `limit` pending events, oldest first.
  auto process_pending(std::size_t limit = SIZE_MAX) -> std::size_t;

  [[nodiscard]] auto get_event(const TenantId &tenant, const EventId &id) const
      -> Result<WebhookEvent>;
  [[nodiscard]] auto find_event(const TenantId &tenant,
                                const IntegrationId &integration,
                                std::string_view external_event_id) const
      -> Result<WebhookEvent>;
  [[nodiscard]] auto stats(const TenantId &tenant,
                           const std::optional<IntegrationId> &integration =
                               std::nullopt) const -> IngestStats;
  // Drops processed and failed events received before `cutoff`.
  auto purge_older_than(TimePoint cutoff) -> std::size_t;

private:
  struct DedupKey {
    TenantId tenant;
    IntegrationId integration;
    std::string external_event_id;
    auto operator==(const DedupKey &) const -> bool = default;
  };
  struct DedupKeyHash {
    auto operator()(const DedupKey &key) const noexcept -> std::size_t {
      return util::combine(key.tenant, key.integration, key.external_event_id);
    }
  };

  [[nodiscard]] auto handler_for(std::string_view source) const
      -> std::shared_ptr<const EventHandler>;
  // nullopt failure means the handler succeeded. A permanent failure skips
  // the remaining attempts.
  [[nodiscard]] auto record_outcome(const TenantId &tenant, const EventId &id,
                                    std::optional<std::string> failure,
                                    bool permanent) -> Result<ProcessingStatus>;

  const Clock &clock_;
  RateLimiter &limiter_;
  NotificationOutbox *outbox_;
  EventIngestionOptions options_;

  util::ShardedMap<DedupKey, EventId, DedupKeyHash> dedup_;
  util::ShardedMap<EventId, WebhookEvent> events_;

  mutable std::shared_mutex handlers_mu_;
  ankerl::unordered_dense::map<std::string, std::shared_ptr<const EventHandler>>
      handlers_;
  IngestionCallbacks callbacks_;
};

} // namespace conductor
