#pragma once

#include "conductor/core/clock.hpp"
#include "conductor/core/constants.hpp"
#include "conductor/core/error.hpp"
#include "conductor/util/hash.hpp"
#include "conductor/util/id.hpp"
#include "conductor/util/sharded_map.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace conductor {

struct RateLimitKey {
  TenantId tenant;
  IntegrationId integration;
  std::string endpoint;

  auto operator==(const RateLimitKey &) const -> bool = default;
};

struct RateLimitKeyHash {
  auto operator()(const RateLimitKey &key) const noexcept -> std::size_t {
    return util::combine(key.tenant, key.integration, key.endpoint);
  }
};

struct RateLimitPolicy {
  int requests_limit{defaults::kRateLimitRequests};
  std::chrono::seconds window{defaults::kRateLimitWindow};

  auto operator==(const RateLimitPolicy &) const -> bool = default;
};

struct RateLimitBucket {
  int requests_made{0};
  int requests_limit{0};
  TimePoint window_start;
  std::chrono::seconds window_duration{0};

  [[nodiscard]] auto reset_at() const noexcept -> TimePoint {
    return window_start + window_duration;
  }
};

struct RateLimitDecision {
  bool allowed{false};
  int remaining{0};
  TimePoint reset_at;
};

// Fixed-window admission control, one bucket per (tenant, integration,
// endpoint). The check, window reset and increment for a key happen under
// that key's shard lock.
class RateLimiter {
public:
  explicit RateLimiter(const Clock &clock = system_clock(),
                       RateLimitPolicy default_policy = {},
                       std::size_t shards = defaults::kShardCount);

  RateLimiter(const RateLimiter &) = delete;
  auto operator=(const RateLimiter &) -> RateLimiter & = delete;

  // Per-key override of the default policy. Applies to an existing bucket
  // immediately; requests already counted in the window stay counted.
  [[nodiscard]] auto configure(const RateLimitKey &key, RateLimitPolicy policy)
      -> Result<void>;

  [[nodiscard]] auto allow(const RateLimitKey &key) -> bool;
  [[nodiscard]] auto check(const RateLimitKey &key) -> RateLimitDecision;
  // Same as allow(), reported as Error::RateLimitExceeded on denial.
  [[nodiscard]] auto acquire(const RateLimitKey &key) -> Result<void>;

  [[nodiscard]] auto bucket(const RateLimitKey &key) const
      -> Result<RateLimitBucket>;
  auto reset(const RateLimitKey &key) -> void;

  [[nodiscard]] auto default_policy() const noexcept
      -> const RateLimitPolicy & {
    return default_policy_;
  }
  [[nodiscard]] auto bucket_count() const -> std::size_t;

private:
  struct Entry {
    std::optional<RateLimitPolicy> policy;
    std::optional<RateLimitBucket> bucket;
  };

  const Clock &clock_;
  RateLimitPolicy default_policy_;
  util::ShardedMap<RateLimitKey, Entry, RateLimitKeyHash> entries_;
};

} // namespace conductor
