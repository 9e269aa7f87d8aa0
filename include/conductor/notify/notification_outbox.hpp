#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/notify/notification.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/sharded_map.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace conductor {

// Bounded queue of notification records waiting for the delivery service.
// When full, the oldest record is dropped.
class NotificationOutbox {
public:
  using Sink = std::move_only_function<void(const NotificationRecord &)>;

  explicit NotificationOutbox(const Clock &clock = system_clock(),
                              std::size_t capacity = defaults::kOutboxCapacity,
                              std::size_t shards = defaults::kShardCount);

  NotificationOutbox(const NotificationOutbox &) = delete;
  auto operator=(const NotificationOutbox &) -> NotificationOutbox & = delete;

  // Called for each record as it is produced, outside the outbox locks.
  auto set_sink(Sink sink) -> void;

  [[nodiscard]] auto subscribe(NotificationSubscription sub)
      -> Result<NotificationId>;
  [[nodiscard]] auto unsubscribe(const TenantId &tenant,
                                 const NotificationId &id) -> Result<void>;
  [[nodiscard]] auto set_active(const TenantId &tenant,
                                const NotificationId &id, bool active)
      -> Result<void>;
  [[nodiscard]] auto subscriptions(const TenantId &tenant) const
      -> std::vector<NotificationSubscription>;

  // One record per matching active subscription, or a single untargeted
  // record when none match. Returns the number of records produced.
  auto emit(NotificationEvent event) -> std::size_t;

  // Removes and returns up to `max` records, oldest first.
  [[nodiscard]] auto drain(std::size_t max = SIZE_MAX)
      -> std::vector<NotificationRecord>;
  [[nodiscard]] auto pending() const -> std::size_t;
  [[nodiscard]] auto dropped() const noexcept -> std::size_t {
    return dropped_.load(std::memory_order_relaxed);
  }

private:
  const Clock &clock_;
  std::size_t capacity_;
  util::ShardedMap<TenantId, std::vector<NotificationSubscription>> subs_;

  mutable std::mutex queue_mu_;
  std::deque<NotificationRecord> queue_;
  std::atomic<std::size_t> dropped_{0};
  Sink sink_;
};

} // namespace conductor
