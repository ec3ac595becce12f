#include "macropipe/pipeline/file_io_pipeline.hpp"

#include "macropipe/util/log.hpp"

#include <cerrno>
#include <fcntl.h>
#include <string_view>
#include <unistd.h>

namespace macropipe {

namespace {

[[nodiscard]] auto write_all(int fd, std::string_view data) -> Result<void> {
  while (!data.empty()) {
    auto n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(last_system_error());
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return ok();
}

} // namespace

auto FileDescriptor::reset() noexcept -> void {
  if (fd_ >= 0) {
    (void)::close(fd_);
    fd_ = -1;
  }
}

FileIoPipeline::FileIoPipeline() {
  register_operation("open", [this](std::span<const std::string> args) {
    return open(args);
  });
  register_operation("write", [this](std::span<const std::string> args) {
    return write(args);
  });
  register_operation("close", [this](std::span<const std::string> args) {
    return close(args);
  });
}

auto FileIoPipeline::open(std::span<const std::string> args) -> Result<void> {
  if (args.size() != 1 || args.front().empty()) {
    return fail(Error::InvalidArgument);
  }
  fd_.reset();
  auto fd = sys_check(::open(args.front().c_str(),
                             O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!fd) {
    return fail(fd.error());
  }
  fd_ = FileDescriptor{*fd};
  path_ = args.front();
  return ok();
}

auto FileIoPipeline::write(std::span<const std::string> args) -> Result<void> {
  if (!fd_.is_open()) {
    return fail(Error::InvalidState);
  }
  for (const auto &line : args) {
    if (auto r = write_all(fd_.get(), line); !r) {
      return r;
    }
    if (auto r = write_all(fd_.get(), "\n"); !r) {
      return r;
    }
  }
  return ok();
}

auto FileIoPipeline::close(std::span<const std::string> /*args*/)
    -> Result<void> {
  if (!fd_.is_open()) {
    return fail(Error::InvalidState);
  }
  if (::close(fd_.release()) < 0) {
    auto ec = last_system_error();
    log::warn("close('{}') failed: {}", path_, ec.message());
    return fail(ec);
  }
  return ok();
}

} // namespace macropipe
