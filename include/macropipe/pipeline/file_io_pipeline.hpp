#pragma once

#include "macropipe/pipeline/pipeline.hpp"

#include <span>
#include <string>
#include <utility>

namespace macropipe {

/// Owning POSIX file descriptor.
class FileDescriptor {
public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) noexcept : fd_{fd} {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;
  FileDescriptor(FileDescriptor &&other) noexcept
      : fd_{std::exchange(other.fd_, -1)} {}
  FileDescriptor &operator=(FileDescriptor &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  [[nodiscard]] auto get() const noexcept -> int { return fd_; }
  [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }
  [[nodiscard]] auto release() noexcept -> int { return std::exchange(fd_, -1); }
  auto reset() noexcept -> void;

private:
  int fd_{-1};
};

/// Writes text lines to a file: `open <path>`, `write <line>...`, `close`.
class FileIoPipeline final : public Pipeline {
public:
  FileIoPipeline();

  [[nodiscard]] auto path() const noexcept -> const std::string & {
    return path_;
  }

private:
  [[nodiscard]] auto open(std::span<const std::string> args) -> Result<void>;
  [[nodiscard]] auto write(std::span<const std::string> args) -> Result<void>;
  [[nodiscard]] auto close(std::span<const std::string> args) -> Result<void>;

  std::string path_;
  FileDescriptor fd_;
};

} // namespace macropipe
