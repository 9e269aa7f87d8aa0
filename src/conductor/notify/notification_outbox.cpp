#include "conductor/notify/notification_outbox.hpp"

#include "conductor/util/log.hpp"

#include <algorithm>
#include <utility>

namespace conductor {

NotificationOutbox::NotificationOutbox(const Clock &clock, std::size_t capacity,
                                       std::size_t shards)
    : clock_(clock), capacity_(capacity == 0 ? 1 : capacity), subs_(shards) {}

auto NotificationOutbox::set_sink(Sink sink) -> void { sink_ = std::move(sink); }

auto NotificationOutbox::subscribe(NotificationSubscription sub)
    -> Result<NotificationId> {
  if (!is_valid_id_text(sub.tenant.value())) {
    return fail(Error::InvalidArgument);
  }
  if (!sub.target_config.empty() && !parse_json(sub.target_config)) {
    return fail(Error::ParseError);
  }
  sub.id = generate_id<NotificationId>("sub");
  sub.trigger_count = 0;
  sub.last_triggered_at.reset();
  auto id = sub.id;
  auto tenant = sub.tenant;
  subs_.with_shard(tenant, [&](auto &map) {
    map[tenant].push_back(std::move(sub));
  });
  return ok(std::move(id));
}

auto NotificationOutbox::unsubscribe(const TenantId &tenant,
                                     const NotificationId &id) -> Result<void> {
  return subs_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto it = map.find(tenant);
    if (it == map.end() ||
        std::erase_if(it->second, [&](const NotificationSubscription &s) {
          return s.id == id;
        }) == 0) {
      return fail(Error::NotFound);
    }
    return ok();
  });
}

auto NotificationOutbox::set_active(const TenantId &tenant,
                                    const NotificationId &id, bool active)
    -> Result<void> {
  return subs_.with_shard(tenant, [&](auto &map) -> Result<void> {
    auto it = map.find(tenant);
    if (it == map.end()) {
      return fail(Error::NotFound);
    }
    auto sub = std::ranges::find(it->second, id, &NotificationSubscription::id);
    if (sub == it->second.end()) {
      return fail(Error::NotFound);
    }
    sub->active = active;
    return ok();
  });
}

auto NotificationOutbox::subscriptions(const TenantId &tenant) const
    -> std::vector<NotificationSubscription> {
  return subs_.with_shard(
      tenant, [&](const auto &map) -> std::vector<NotificationSubscription> {
        auto it = map.find(tenant);
        if (it == map.end()) {
          return {};
        }
        return it->second;
      });
}

auto NotificationOutbox::emit(NotificationEvent event) -> std::size_t {
  const auto now = clock_.now();
  std::vector<NotificationRecord> records;

  subs_.with_shard(event.tenant, [&](auto &map) {
    auto it = map.find(event.tenant);
    if (it == map.end()) {
      return;
    }
    for (auto &sub : it->second) {
      if (!sub.active || sub.type != event.type) {
        continue;
      }
      if (sub.integration && sub.integration != event.integration) {
        continue;
      }
      ++sub.trigger_count;
      sub.last_triggered_at = now;
      records.push_back(NotificationRecord{
          .id = generate_id<NotificationId>("ntf"),
          .tenant = event.tenant,
          .integration = event.integration,
          .subscription = sub.id,
          .type = event.type,
          .target_config = sub.target_config,
          .message = event.message,
          .details = event.details,
          .triggered_at = now});
    }
  });

  if (records.empty()) {
    records.push_back(NotificationRecord{
        .id = generate_id<NotificationId>("ntf"),
        .tenant = event.tenant,
        .integration = event.integration,
        .subscription = std::nullopt,
        .type = event.type,
        .target_config = {},
        .message = std::move(event.message),
        .details = std::move(event.details),
        .triggered_at = now});
  }

  std::size_t overflow = 0;
  {
    std::lock_guard lock(queue_mu_);
    for (const auto &record : records) {
      if (queue_.size() >= capacity_) {
        queue_.pop_front();
        ++overflow;
      }
      queue_.push_back(record);
    }
  }
  if (overflow > 0) {
    dropped_.fetch_add(overflow, std::memory_order_relaxed);
    log::warn("Notification outbox full, dropped {} oldest record(s)",
              overflow);
  }

  log::debug("Notification {} for tenant {}: {} record(s)",
             to_string_view(records.front().type), records.front().tenant,
             records.size());
  if (sink_) {
    for (const auto &record : records) {
      sink_(record);
    }
  }
  return records.size();
}

auto NotificationOutbox::drain(std::size_t max)
    -> std::vector<NotificationRecord> {
  std::lock_guard lock(queue_mu_);
  const auto n = std::min(max, queue_.size());
  std::vector<NotificationRecord> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return out;
}

auto NotificationOutbox::pending() const -> std::size_t {
  std::lock_guard lock(queue_mu_);
  return queue_.size();
}

} // namespace conductor
