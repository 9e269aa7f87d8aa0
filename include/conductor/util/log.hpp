#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace conductor::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "critical"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m", // error: red
    "\o{33}[1;35m" // critical: bold magenta
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Async logger. Producers format on their own thread and push finished lines
// through a bounded concurrent_channel; one writer thread owns the FILE*.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex out_mu_;
  FILE *out_{stdout};
  FILE *owned_file_{nullptr};

  boost::asio::io_context queue_ctx_{1};
  std::shared_ptr<LogChannel> queue_;
  std::jthread writer_;

  [[nodiscard]] static auto format_line(Level level, std::string_view body)
      -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::string line;
    line.reserve(body.size() + 64);
    std::format_to(std::back_inserter(line),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", now,
                   level_color(level), level_name(level), tid, body);
    return line;
  }

  auto write_direct(std::string_view line) -> void {
    std::lock_guard lock(out_mu_);
    std::fwrite(line.data(), 1, line.size(), out_);
    std::fflush(out_);
  }

  auto write_batch(const std::vector<std::string> &batch) -> void {
    std::lock_guard lock(out_mu_);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), out_);
    }
    std::fflush(out_);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      bool closed = false;
      batch.clear();
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (ec) {
              closed = true;
              return;
            }
            batch.push_back(std::move(line));
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (closed) {
        break;
      }

      while (batch.size() < kBatchSize &&
             queue->try_receive(
                 [&](const boost::system::error_code &ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
      write_batch(batch);
    }

    // Flush whatever producers managed to enqueue before stop().
    batch.clear();
    while (queue->try_receive(
        [&](const boost::system::error_code &ec, std::string line) {
          if (!ec) {
            batch.push_back(std::move(line));
          }
        })) {
    }
    write_batch(batch);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    queue_ = std::make_shared<LogChannel>(queue_ctx_.get_executor(),
                                          kQueueCapacity);
    writer_ = std::jthread([this, queue = queue_] { writer_loop(queue); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    if (queue_) {
      queue_->close();
    }
    queue_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
    queue_.reset();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  auto set_output_stderr() -> void {
    std::lock_guard lock(out_mu_);
    out_ = stderr;
  }

  // Empty path restores stdout.
  auto set_output_file(std::string_view path) -> bool {
    std::lock_guard lock(out_mu_);
    if (path.empty()) {
      out_ = stdout;
      if (owned_file_ != nullptr) {
        std::fclose(owned_file_);
        owned_file_ = nullptr;
      }
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
    owned_file_ = f;
    out_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line =
        format_line(level, std::format(fmt, std::forward<Args>(args)...));

    if (!running_.load(std::memory_order_acquire) || !queue_) {
      write_direct(line);
      return;
    }
    if (!queue_->try_send(boost::system::error_code{}, std::move(line))) {
      // Queue full: never block a worker thread on logging.
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto critical(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Critical, fmt, std::forward<Args>(args)...);
}

} // namespace conductor::log
