#include "conductor/ingest/event_ingestion.hpp"

#include "conductor/util/json.hpp"
#include "conductor/util/log.hpp"
#include "conductor/util/time.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <format>
#include <mutex>
#include <utility>
#include <vector>

namespace conductor {

EventIngestionPipeline::EventIngestionPipeline(const Clock &clock,
                                               RateLimiter &limiter,
                                               NotificationOutbox *outbox,
                                               EventIngestionOptions options,
                                               std::size_t shards)
    : clock_(clock), limiter_(limiter), outbox_(outbox), options_(options),
      dedup_(shards), events_(shards) {
  options_.max_attempts = std::max(options_.max_attempts, 1);
}

auto EventIngestionPipeline::set_callbacks(IngestionCallbacks callbacks)
    -> void {
  callbacks_ = std::move(callbacks);
}

auto EventIngestionPipeline::register_handler(std::string source,
                                              EventHandler handler) -> void {
  auto ptr = std::make_shared<const EventHandler>(std::move(handler));
  std::unique_lock lock(handlers_mu_);
  handlers_.insert_or_assign(std::move(source), std::move(ptr));
}

auto EventIngestionPipeline::has_handler(std::string_view source) const
    -> bool {
  return handler_for(source) != nullptr;
}

auto EventIngestionPipeline::handler_for(std::string_view source) const
    -> std::shared_ptr<const EventHandler> {
  std::shared_lock lock(handlers_mu_);
  auto it = handlers_.find(std::string(source));
  return it == handlers_.end() ? nullptr : it->second;
}

auto EventIngestionPipeline::ingest(const TenantId &tenant, InboundEvent event)
    -> Result<IngestOutcome> {
  if (!is_valid_id_text(tenant.value()) ||
      !is_valid_id_text(event.integration.value()) || event.source.empty() ||
      event.external_event_id.empty()) {
    return fail(Error::InvalidArgument);
  }

  const auto now = clock_.now();
  DedupKey key{.tenant = tenant,
               .integration = event.integration,
               .external_event_id = event.external_event_id};
  RateLimitKey limit_key{.tenant = tenant,
                         .integration = event.integration,
                         .endpoint = event.source};
  std::optional<RateLimitDecision> denied;

  auto res = dedup_.with_shard(key, [&](auto &seen) -> Result<IngestOutcome> {
    if (auto it = seen.find(key); it != seen.end()) {
      return ok(IngestOutcome{.id = it->second, .duplicate = true});
    }

    auto decision = limiter_.check(limit_key);
    if (!decision.allowed) {
      denied = decision;
      return fail(Error::RateLimitExceeded);
    }

    auto id = generate_id<EventId>("evt");
    WebhookEvent record{.id = id,
                        .tenant = tenant,
                        .integration = std::move(event.integration),
                        .source = std::move(event.source),
                        .external_event_id = std::move(event.external_event_id),
                        .event_type = std::move(event.event_type),
                        .payload = std::move(event.payload),
                        .headers = std::move(event.headers),
                        .status = ProcessingStatus::Pending,
                        .processing_attempts = 0,
                        .max_attempts = options_.max_attempts,
                        .retry_after = std::nullopt,
                        .error_details = {},
                        .received_at = now,
                        .processed_at = std::nullopt};
    events_.with_shard(id, [&](auto &events) {
      events.emplace(id, std::move(record));
    });
    seen.emplace(key, id);
    return ok(IngestOutcome{.id = std::move(id), .duplicate = false});
  });

  if (denied) {
    const auto reset_at = util::format_iso8601(denied->reset_at);
    log::warn("Rate limit exceeded for {}/{}, resets at {}", tenant,
              key.integration, reset_at);
    if (outbox_ != nullptr) {
      JsonValue details = {{"integration_id", key.integration.str()},
                           {"endpoint", limit_key.endpoint},
                           {"reset_at", reset_at}};
      outbox_->emit(NotificationEvent{
          .tenant = tenant,
          .integration = key.integration,
          .type = NotificationType::RateLimit,
          .message = std::format("rate limit exceeded for integration {}",
                                 key.integration),
          .details = dump_json(details)});
    }
    return fail(Error::RateLimitExceeded);
  }
  if (!res) {
    return res;
  }
  if (res->duplicate) {
    log::debug("Duplicate event {} from integration {} ignored",
               key.external_event_id, key.integration);
  } else {
    log::debug("Ingested event {} ({}) from {}", res->id, key.external_event_id,
               key.integration);
  }
  return res;
}

auto EventIngestionPipeline::process(const TenantId &tenant, const EventId &id)
    -> Result<ProcessingStatus> {
  std::optional<WebhookEvent> snapshot;
  auto claimed = events_.with_shard(id, [&](auto &events) -> Result<void> {
    auto it = events.find(id);
    if (it == events.end() || it->second.tenant != tenant) {
      return fail(Error::NotFound);
    }
    auto &event = it->second;
    if (event.status != ProcessingStatus::Pending &&
        event.status != ProcessingStatus::Retrying) {
      return fail(Error::InvalidState);
    }
    ++event.processing_attempts;
    event.status = ProcessingStatus::Processing;
    snapshot = event;
    return ok();
  });
  if (!claimed) {
    return fail(claimed.error());
  }

  auto handler = handler_for(snapshot->source);
  if (!handler) {
    return record_outcome(
        tenant, id,
        std::format("no handler registered for source '{}'", snapshot->source),
        true);
  }

  std::optional<std::string> failure;
  try {
    if (auto r = (*handler)(*snapshot); !r) {
      failure = r.error().message();
    }
  } catch (const std::exception &e) {
    failure = std::format("handler threw: {}", e.what());
  }
  return record_outcome(tenant, id, std::move(failure), false);
}

auto EventIngestionPipeline::record_outcome(const TenantId &tenant,
                                            const EventId &id,
                                            std::optional<std::string> failure,
                                            bool permanent)
    -> Result<ProcessingStatus> {
  const auto now = clock_.now();
  std::optional<WebhookEvent> finished;
  int attempts = 0;

  auto status = events_.with_shard(
      id, [&](auto &events) -> Result<ProcessingStatus> {
        auto it = events.find(id);
        if (it == events.end()) {
          return fail(Error::NotFound);
        }
        auto &event = it->second;
        if (event.status != ProcessingStatus::Processing) {
          return fail(Error::InvalidState);
        }
        attempts = event.processing_attempts;

        if (!failure) {
          event.status = ProcessingStatus::Processed;
          event.processed_at = now;
          event.error_details.clear();
          event.retry_after.reset();
          finished = event;
          return ok(event.status);
        }

        event.error_details = std::move(*failure);
        if (!permanent && event.processing_attempts < event.max_attempts) {
          event.status = ProcessingStatus::Retrying;
          event.retry_after =
              now + event.processing_attempts * options_.retry_backoff;
          return ok(event.status);
        }
        event.status = ProcessingStatus::Failed;
        event.retry_after.reset();
        finished = event;
        return ok(event.status);
      });
  if (!status) {
    return status;
  }

  if (*status == ProcessingStatus::Retrying) {
    log::warn("Event {} failed (attempt {}), will retry", id, attempts);
    return status;
  }

  if (*status == ProcessingStatus::Processed) {
    if (callbacks_.on_processed) {
      callbacks_.on_processed(*finished);
    }
    return status;
  }

  log::error("Event {} from {} failed permanently after {} attempt(s): {}", id,
             finished->integration, finished->processing_attempts,
             finished->error_details);
  if (outbox_ != nullptr) {
    JsonValue details = {
        {"event_id", id.str()},
        {"external_event_id", finished->external_event_id},
        {"event_type", finished->event_type},
        {"attempts", static_cast<std::int64_t>(finished->processing_attempts)},
        {"error", finished->error_details}};
    outbox_->emit(NotificationEvent{
        .tenant = tenant,
        .integration = finished->integration,
        .type = NotificationType::WebhookFailed,
        .message = std::format("event {} from {} could not be processed",
                               finished->external_event_id, finished->source),
        .details = dump_json(details)});
  }
  if (callbacks_.on_failed) {
    callbacks_.on_failed(*finished);
  }
  return status;
}

auto EventIngestionPipeline::sweep_retries(TimePoint now) -> std::size_t {
  std::vector<std::pair<TenantId, EventId>> due;
  events_.for_each_shard([&](const auto &events) {
    for (const auto &[id, event] : events) {
      if (event.status == ProcessingStatus::Retrying && event.retry_after &&
          *event.retry_after <= now) {
        due.emplace_back(event.tenant, id);
      }
    }
  });

  std::size_t processed = 0;
  for (const auto &[tenant, id] : due) {
    if (process(tenant, id)) {
      ++processed;
    }
  }
  if (processed > 0) {
    log::debug("Retry sweep re-processed {} event(s)", processed);
  }
  return processed;
}

auto EventIngestionPipeline::process_pending(std::size_t limit)
    -> std::size_t {
  struct Due {
    TimePoint received_at;
    TenantId tenant;
    EventId id;
  };
  std::vector<Due> pending;
  events_.for_each_shard([&](const auto &events) {
    for (const auto &[id, event] : events) {
      if (event.status == ProcessingStatus::Pending) {
        pending.push_back(
            Due{.received_at = event.received_at, .tenant = event.tenant, .id = id});
      }
    }
  });
  std::ranges::sort(pending, {}, &Due::received_at);

  std::size_t processed = 0;
  for (const auto &item : pending) {
    if (processed >= limit) {
      break;
    }
    if (process(item.tenant, item.id)) {
      ++processed;
    }
  }
  return processed;
}

auto EventIngestionPipeline::get_event(const TenantId &tenant,
                                       const EventId &id) const
    -> Result<WebhookEvent> {
  auto event = events_.find_copy(id);
  if (!event || event->tenant != tenant) {
    return fail(Error::NotFound);
  }
  return ok(std::move(*event));
}

auto EventIngestionPipeline::find_event(const TenantId &tenant,
                                        const IntegrationId &integration,
                                        std::string_view external_event_id) const
    -> Result<WebhookEvent> {
  auto id = dedup_.find_copy(
      DedupKey{.tenant = tenant,
               .integration = integration,
               .external_event_id = std::string(external_event_id)});
  if (!id) {
    return fail(Error::NotFound);
  }
  return get_event(tenant, *id);
}

auto EventIngestionPipeline::stats(
    const TenantId &tenant, const std::optional<IntegrationId> &integration) const
    -> IngestStats {
  IngestStats out;
  events_.for_each_shard([&](const auto &events) {
    for (const auto &[id, event] : events) {
      if (event.tenant != tenant ||
          (integration && event.integration != *integration)) {
        continue;
      }
      switch (event.status) {
      case ProcessingStatus::Pending:
        ++out.pending;
        break;
      case ProcessingStatus::Processing:
        ++out.processing;
        break;
      case ProcessingStatus::Processed:
        ++out.processed;
        break;
      case ProcessingStatus::Failed:
        ++out.failed;
        break;
      case ProcessingStatus::Retrying:
        ++out.retrying;
        break;
      }
    }
  });
  return out;
}

auto EventIngestionPipeline::purge_older_than(TimePoint cutoff) -> std::size_t {
  std::vector<DedupKey> keys;
  events_.for_each_shard([&](auto &events) {
    std::vector<EventId> doomed;
    for (const auto &[id, event] : events) {
      if (is_terminal(event.status) && event.received_at < cutoff) {
        doomed.push_back(id);
        keys.push_back(DedupKey{.tenant = event.tenant,
                                .integration = event.integration,
                                .external_event_id = event.external_event_id});
      }
    }
    for (const auto &id : doomed) {
      events.erase(id);
    }
  });

  for (const auto &key : keys) {
    dedup_.with_shard(key, [&](auto &seen) { seen.erase(key); });
  }
  if (!keys.empty()) {
    log::info("Purged {} event(s) received before {}", keys.size(),
              util::format_iso8601(cutoff));
  }
  return keys.size();
}

} // namespace conductor
