#pragma once

/** \file byte_source.hpp
 *  \brief Sequential, abandonable byte sources.
 *
 * Notes
 * - A source yields data in chunks of unspecified size; read() returning 0 means end of source.
 * - close() abandons the source before its end. It is idempotent and also runs on destruction,
 *   so a source is released on every exit path of its owner.
 * - Sources are not thread-safe; one reader per source.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <utility>

#include "deltachain/error.hpp"

namespace deltachain::io {

class ByteSource {
public:
  virtual ~ByteSource() = default;

  /** Reads up to buf.size() bytes. Returns 0 at end of source, io_failed on failure or after close(). */
  virtual auto read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> = 0;

  /** Releases the underlying resource without reading the remainder. */
  virtual void close() noexcept = 0;

  virtual bool is_open() const noexcept = 0;

  /** Identifier used in diagnostics (a path for files). */
  virtual const std::string& name() const noexcept = 0;
};

/** \brief POSIX file-descriptor backed source. */
class FileByteSource final : public ByteSource {
public:
  static auto open(const std::filesystem::path& path)
      -> std::expected<std::unique_ptr<ByteSource>, core::error>;

  ~FileByteSource() override;
  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  auto read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> override;
  void close() noexcept override;
  bool is_open() const noexcept override { return fd_ >= 0; }
  const std::string& name() const noexcept override { return name_; }

private:
  FileByteSource(int fd, std::string name) : fd_(fd), name_(std::move(name)) {}

  int fd_{-1};
  std::string name_;
};

/** \brief Serves an owned buffer in chunks of at most max_chunk bytes. */
class MemoryByteSource final : public ByteSource {
public:
  explicit MemoryByteSource(std::string data, std::size_t max_chunk = 4096, std::string name = "memory");

  auto read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> override;
  void close() noexcept override;
  bool is_open() const noexcept override { return open_; }
  const std::string& name() const noexcept override { return name_; }

  std::size_t bytes_served() const noexcept { return pos_; }

private:
  std::string data_;
  std::size_t max_chunk_;
  std::string name_;
  std::size_t pos_{0};
  bool open_{true};
};

/** Opens a byte source for a file name. */
using SourceFactory = std::function<std::expected<std::unique_ptr<ByteSource>, core::error>(const std::string& name)>;

/** Factory that opens dir / name as a FileByteSource. */
SourceFactory directory_source_factory(std::filesystem::path dir);

} // namespace deltachain::io
