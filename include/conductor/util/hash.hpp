#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace conductor::util {

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

template <typename T>
inline auto mix_into(std::size_t &seed, const T &value) noexcept -> void {
  constexpr std::size_t kMagic = 0x9e3779b97f4a7c15ULL;
  seed ^= std::hash<T>{}(value) + kMagic + (seed << 6) + (seed >> 2);
}

// Combine multiple values into a single hash
template <typename... Ts>
[[nodiscard]] inline auto combine(const Ts &...values) noexcept -> std::size_t {
  std::size_t seed = 0;
  (mix_into(seed, values), ...);
  return seed;
}

// Shard selection. std::hash of strings is not guaranteed to spread well in
// its low bits, so remix before taking the modulo.
[[nodiscard]] inline auto shard_of(std::size_t hash,
                                   std::size_t shard_count) noexcept
    -> std::size_t {
  return static_cast<std::size_t>(
      murmur3_mix64(static_cast<std::uint64_t>(hash)) % shard_count);
}

} // namespace conductor::util
