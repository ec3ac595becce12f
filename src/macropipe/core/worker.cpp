#include "macropipe/core/worker.hpp"

#include "macropipe/util/log.hpp"

#include <format>
#include <system_error>

namespace macropipe {

Worker::Worker(worker_id id, unsigned threads)
    : id_{id}, thread_count_{threads == 0 ? 1U : threads},
      ctx_{static_cast<int>(thread_count_)},
      process_gate_{ctx_.get_executor(), thread_count_} {}

Worker::~Worker() {
  stop();
  release_scratch();
}

auto Worker::start(const ThreadInit &on_thread_start) -> void {
  ctx_.restart();
  work_guard_.emplace(boost::asio::make_work_guard(ctx_));
  threads_.reserve(thread_count_);
  for (unsigned i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this, on_thread_start] {
      if (on_thread_start) {
        on_thread_start(id_);
      }
      ctx_.run();
    });
  }
}

auto Worker::stop() noexcept -> void {
  if (work_guard_.has_value()) {
    work_guard_->reset();
    work_guard_.reset();
  }
  ctx_.stop();
  // std::jthread joins on destruction
  threads_.clear();
}

auto Worker::acquire_scratch(const std::filesystem::path &root)
    -> Result<void> {
  auto dir = root / std::format("worker-{}", id_);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    log::error("worker {}: cannot create scratch directory {}: {}", id_,
               dir.string(), ec.message());
    return fail(ec);
  }
  scratch_dir_ = std::move(dir);
  return ok();
}

auto Worker::release_scratch() noexcept -> void {
  if (scratch_dir_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(scratch_dir_, ec);
  if (ec) {
    log::warn("worker {}: failed to remove scratch directory {}: {}", id_,
              scratch_dir_.string(), ec.message());
  }
  scratch_dir_.clear();
}

} // namespace macropipe
