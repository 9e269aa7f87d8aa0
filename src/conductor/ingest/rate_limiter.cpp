#include "conductor/ingest/rate_limiter.hpp"

#include "conductor/util/log.hpp"

#include <algorithm>

namespace conductor {
namespace {

[[nodiscard]] auto sanitize(RateLimitPolicy policy) -> RateLimitPolicy {
  policy.requests_limit = std::max(policy.requests_limit, 1);
  policy.window = std::max(policy.window, std::chrono::seconds(1));
  return policy;
}

} // namespace

RateLimiter::RateLimiter(const Clock &clock, RateLimitPolicy default_policy,
                         std::size_t shards)
    : clock_(clock), default_policy_(sanitize(default_policy)),
      entries_(shards) {}

auto RateLimiter::configure(const RateLimitKey &key, RateLimitPolicy policy)
    -> Result<void> {
  if (policy.requests_limit <= 0 || policy.window.count() <= 0) {
    return fail(Error::InvalidArgument);
  }
  entries_.with_shard(key, [&](auto &map) {
    auto &entry = map[key];
    entry.policy = policy;
    if (entry.bucket) {
      entry.bucket->requests_limit = policy.requests_limit;
      entry.bucket->window_duration = policy.window;
      entry.bucket->requests_made =
          std::min(entry.bucket->requests_made, policy.requests_limit);
    }
  });
  log::debug("Rate limit for {}/{}:{} set to {} per {}s", key.tenant,
             key.integration, key.endpoint, policy.requests_limit,
             policy.window.count());
  return ok();
}

auto RateLimiter::check(const RateLimitKey &key) -> RateLimitDecision {
  const auto now = clock_.now();
  return entries_.with_shard(key, [&](auto &map) -> RateLimitDecision {
    auto &entry = map[key];

    if (!entry.bucket) {
      const auto policy = entry.policy.value_or(default_policy_);
      entry.bucket = RateLimitBucket{.requests_made = 1,
                                     .requests_limit = policy.requests_limit,
                                     .window_start = now,
                                     .window_duration = policy.window};
      return {.allowed = true,
              .remaining = policy.requests_limit - 1,
              .reset_at = entry.bucket->reset_at()};
    }

    auto &bucket = *entry.bucket;
    if (now - bucket.window_start >= bucket.window_duration) {
      bucket.window_start = now;
      bucket.requests_made = 1;
      return {.allowed = true,
              .remaining = bucket.requests_limit - 1,
              .reset_at = bucket.reset_at()};
    }

    if (bucket.requests_made < bucket.requests_limit) {
      ++bucket.requests_made;
      return {.allowed = true,
              .remaining = bucket.requests_limit - bucket.requests_made,
              .reset_at = bucket.reset_at()};
    }

    return {.allowed = false, .remaining = 0, .reset_at = bucket.reset_at()};
  });
}

auto RateLimiter::allow(const RateLimitKey &key) -> bool {
  return check(key).allowed;
}

auto RateLimiter::acquire(const RateLimitKey &key) -> Result<void> {
  if (auto decision = check(key); !decision.allowed) {
    log::debug("Rate limit exhausted for {}/{}:{}", key.tenant,
               key.integration, key.endpoint);
    return fail(Error::RateLimitExceeded);
  }
  return ok();
}

auto RateLimiter::bucket(const RateLimitKey &key) const
    -> Result<RateLimitBucket> {
  return entries_.with_shard(
      key, [&](const auto &map) -> Result<RateLimitBucket> {
        auto it = map.find(key);
        if (it == map.end() || !it->second.bucket) {
          return fail(Error::NotFound);
        }
        return ok(*it->second.bucket);
      });
}

auto RateLimiter::reset(const RateLimitKey &key) -> void {
  entries_.with_shard(key, [&](auto &map) {
    if (auto it = map.find(key); it != map.end()) {
      it->second.bucket.reset();
    }
  });
}

auto RateLimiter::bucket_count() const -> std::size_t {
  std::size_t count = 0;
  entries_.for_each_shard([&](const auto &map) {
    for (const auto &[key, entry] : map) {
      if (entry.bucket) {
        ++count;
      }
    }
  });
  return count;
}

} // namespace conductor
