#include "deltachain/io/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace deltachain::io {

auto FileByteSource::open(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<ByteSource>, core::error> {
  using core::error; using core::error_code;
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    const int err = errno;
    const auto code = (err == ENOENT) ? error_code::not_found : error_code::io_failed;
    return std::unexpected(error{code, "open failed: " + path.string() + ": " + std::strerror(err), "io.file"});
  }
#if defined(POSIX_FADV_SEQUENTIAL)
  (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
  return std::unique_ptr<ByteSource>(new FileByteSource(fd, path.string()));
}

FileByteSource::~FileByteSource() { close(); }

auto FileByteSource::read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (fd_ < 0) return std::unexpected(error{error_code::io_failed, "read after close: " + name_, "io.file"});
  if (buf.empty()) return std::size_t{0};
  while (true) {
    ssize_t n = ::read(fd_, buf.data(), buf.size());
    if (n >= 0) return static_cast<std::size_t>(n);
    if (errno == EINTR) continue;
    const int err = errno;
    return std::unexpected(error{error_code::io_failed, "read failed: " + name_ + ": " + std::strerror(err), "io.file"});
  }
}

void FileByteSource::close() noexcept {
  if (fd_ >= 0) {
    (void)::close(fd_);
    fd_ = -1;
  }
}

MemoryByteSource::MemoryByteSource(std::string data, std::size_t max_chunk, std::string name)
  : data_(std::move(data)), max_chunk_(max_chunk == 0 ? 1 : max_chunk), name_(std::move(name)) {}

auto MemoryByteSource::read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (!open_) return std::unexpected(error{error_code::io_failed, "read after close: " + name_, "io.memory"});
  const std::size_t n = std::min({buf.size(), max_chunk_, data_.size() - pos_});
  if (n == 0) return std::size_t{0};
  std::memcpy(buf.data(), data_.data() + pos_, n);
  pos_ += n;
  return n;
}

void MemoryByteSource::close() noexcept { open_ = false; }

SourceFactory directory_source_factory(std::filesystem::path dir) {
  return [dir = std::move(dir)](const std::string& name) {
    return FileByteSource::open(dir / name);
  };
}

} // namespace deltachain::io
