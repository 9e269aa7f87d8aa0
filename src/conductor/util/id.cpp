#include "conductor/util/id.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace conductor::detail {

auto generate_uuid_v7_like() -> std::string {
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;
  // Ids created in the same millisecond still sort in creation order on a
  // single thread.
  static std::atomic<std::uint64_t> sequence{0};
  const auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  const auto seq = sequence.fetch_add(1, std::memory_order_relaxed) & 0xffff;
  const auto rnd = dis(gen) & 0xffffffffffffULL;
  return std::format("{:012x}{:04x}{:012x}", now_ms, seq, rnd);
}

} // namespace conductor::detail
