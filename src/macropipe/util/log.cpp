#include "macropipe/util/log.hpp"

#include <array>
#include <chrono>
#include <iterator>
#include <optional>
#include <unistd.h>
#include <vector>

namespace macropipe::log {

namespace {

constexpr std::array<std::string_view, 6> kLevelColors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m", // error: red
    "",
};
constexpr std::string_view kColorReset = "\o{33}[0m";

} // namespace

auto parse_level(std::string_view name) -> Level {
  return util::parse_enum(name, Level::Info);
}

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  stop();
  if (file_) {
    std::fclose(file_);
  }
}

auto Logger::format_line(Level level, std::string_view message) const
    -> std::string {
  const auto now = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  std::string line;
  line.reserve(message.size() + 64);
  auto *out = output_.load(std::memory_order_acquire);
  const bool color = out && out != file_ && ::isatty(::fileno(out)) != 0;
  // pid rather than thread id: process-mode children share the sink.
  std::format_to(std::back_inserter(line),
                 "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                 color ? kLevelColors.at(std::to_underlying(level)) : "",
                 level, color ? kColorReset : "", ::getpid(), message);
  return line;
}

auto Logger::submit(std::string line) -> void {
  if (running_.load(std::memory_order_acquire)) {
    if (auto queue = queue_.load(std::memory_order_acquire);
        queue && queue->try_send(boost::system::error_code{}, line)) {
      return;
    }
  }
  write_out(line);
  flush();
}

auto Logger::write_out(std::string_view line) -> void {
  auto *out = output_.load(std::memory_order_acquire);
  std::fwrite(line.data(), 1, line.size(), out ? out : stdout);
}

auto Logger::flush() -> void {
  auto *out = output_.load(std::memory_order_acquire);
  std::fflush(out ? out : stdout);
}

auto Logger::writer_loop(std::shared_ptr<LogChannel> queue) -> void {
  std::vector<std::string> batch;
  batch.reserve(kBatchSize);

  auto take_ready = [&] {
    while (batch.size() < kBatchSize &&
           queue->try_receive(
               [&](const boost::system::error_code &ec, std::string item) {
                 if (!ec) {
                   batch.push_back(std::move(item));
                 }
               })) {
    }
  };

  for (;;) {
    std::optional<std::string> first;
    boost::system::error_code recv_ec;
    queue->async_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          recv_ec = ec;
          if (!ec) {
            first = std::move(item);
          }
        });
    queue_ctx_.restart();
    (void)queue_ctx_.run_one();
    if (recv_ec || !first) {
      break;
    }

    batch.clear();
    batch.push_back(std::move(*first));
    take_ready();
    for (const auto &line : batch) {
      write_out(line);
    }
    flush();
  }

  // Channel closed: whatever is still buffered goes out now.
  do {
    batch.clear();
    take_ready();
    for (const auto &line : batch) {
      write_out(line);
    }
  } while (!batch.empty());
  flush();
}

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  queue_ctx_.restart();
  auto queue =
      std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
  queue_.store(queue, std::memory_order_release);
  writer_ = std::jthread(
      [this, queue = std::move(queue)] { writer_loop(queue); });
}

auto Logger::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
    queue->close();
  }
  if (writer_.joinable()) {
    writer_.join();
  }
}

auto Logger::detach_after_fork() noexcept -> void {
  level_.store(Level::Off, std::memory_order_release);
  running_.store(false, std::memory_order_release);
}

auto Logger::set_output_stderr() noexcept -> void {
  output_.store(stderr, std::memory_order_release);
}

auto Logger::set_output_file(std::string_view path) -> bool {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  if (path.empty()) {
    output_.store(stdout, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    return true;
  }
  FILE *f = std::fopen(std::string(path).c_str(), "a");
  if (!f) {
    return false;
  }
  std::setvbuf(f, nullptr, _IOLBF, 0);
  output_.store(f, std::memory_order_release);
  if (file_) {
    std::fclose(file_);
  }
  file_ = f;
  return true;
}

} // namespace macropipe::log
