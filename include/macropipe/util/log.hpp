#pragma once

#include "macropipe/util/enum.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/describe/enum.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace macropipe::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };
BOOST_DESCRIBE_ENUM(Level, Trace, Debug, Info, Warn, Error, Off)

/// Unknown names select Info.
[[nodiscard]] auto parse_level(std::string_view name) -> Level;

/// Asynchronous logger. Callers format the line; one writer thread drains a
/// bounded channel to the sink. While stopped, or when the channel is full,
/// the caller writes the line itself.
class Logger {
public:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void;
  /// Flushes queued lines and joins the writer.
  auto stop() -> void;

  /// Silence everything in a forked child: the writer thread does not exist
  /// there and the channel lock may be held by a thread that vanished.
  auto detach_after_fork() noexcept -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    const auto threshold = this->level();
    return threshold != Level::Off && level >= threshold;
  }

  auto set_output_stderr() noexcept -> void;
  /// Append to `path` (empty: back to stdout). Refused while running.
  [[nodiscard]] auto set_output_file(std::string_view path) -> bool;

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    submit(format_line(level,
                       std::format(fmt, std::forward<Args>(args)...)));
  }

private:
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  [[nodiscard]] auto format_line(Level level, std::string_view message) const
      -> std::string;
  auto submit(std::string line) -> void;
  auto write_out(std::string_view line) -> void;
  auto flush() -> void;
  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;
};

auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}
inline auto set_level(std::string_view name) -> void {
  logger().set_level(parse_level(name));
}
inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}
inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}
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

} // namespace macropipe::log
