#pragma once

#include "conductor/core/constants.hpp"
#include "conductor/util/hash.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace conductor::util {

// Entity table split into independently locked shards. Every check-then-act
// on one entity runs inside with_shard(), so callers operating on different
// keys only contend when their keys share a shard.
template <typename K, typename V, typename Hash = std::hash<K>>
class ShardedMap {
public:
  using Map = ankerl::unordered_dense::map<K, V, Hash>;

  explicit ShardedMap(std::size_t shard_count = defaults::kShardCount)
      : shards_(shard_count == 0 ? 1 : shard_count) {}

  ShardedMap(const ShardedMap &) = delete;
  auto operator=(const ShardedMap &) -> ShardedMap & = delete;

  [[nodiscard]] auto shard_count() const noexcept -> std::size_t {
    return shards_.size();
  }

  [[nodiscard]] auto shard_index(const K &key) const -> std::size_t {
    return shard_of(Hash{}(key), shards_.size());
  }

  // Runs fn(map) with the shard that owns `key` locked.
  template <typename Fn> auto with_shard(const K &key, Fn &&fn) {
    auto &shard = shards_[shard_index(key)];
    std::lock_guard lock(shard.mu);
    return std::invoke(std::forward<Fn>(fn), shard.map);
  }

  template <typename Fn> auto with_shard(const K &key, Fn &&fn) const {
    const auto &shard = shards_[shard_index(key)];
    std::lock_guard lock(shard.mu);
    return std::invoke(std::forward<Fn>(fn), std::as_const(shard.map));
  }

  // Visits shards one at a time; never holds two shard locks at once.
  template <typename Fn> auto for_each_shard(Fn &&fn) -> void {
    for (auto &shard : shards_) {
      std::lock_guard lock(shard.mu);
      fn(shard.map);
    }
  }

  template <typename Fn> auto for_each_shard(Fn &&fn) const -> void {
    for (const auto &shard : shards_) {
      std::lock_guard lock(shard.mu);
      fn(std::as_const(shard.map));
    }
  }

  [[nodiscard]] auto find_copy(const K &key) const -> std::optional<V> {
    return with_shard(key, [&](const Map &map) -> std::optional<V> {
      auto it = map.find(key);
      if (it == map.end()) {
        return std::nullopt;
      }
      return it->second;
    });
  }

  [[nodiscard]] auto contains(const K &key) const -> bool {
    return with_shard(key,
                      [&](const Map &map) { return map.contains(key); });
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::size_t total = 0;
    for_each_shard([&](const Map &map) { total += map.size(); });
    return total;
  }

private:
  struct alignas(64) Shard {
    mutable std::mutex mu;
    Map map;
  };

  std::vector<Shard> shards_;
};

} // namespace conductor::util
