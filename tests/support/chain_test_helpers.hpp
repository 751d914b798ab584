#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "deltachain/io/byte_source.hpp"

namespace chain_test_helpers {

// "-- Increment timestamp: <current>\n-- Previous timestamp: <previous>\n" (CRLF when crlf=true)
std::string header_text(const std::string& current, const std::string& previous, bool crlf = false);

// Writes dir/name with the two header lines followed by filler_bytes of SQL-ish filler.
// Throws std::runtime_error on I/O errors.
void write_incremental(const std::filesystem::path& dir, const std::string& name,
                       const std::string& current, const std::string& previous,
                       std::size_t filler_bytes = 0, bool crlf = false);

// Fresh empty directory under the temp directory.
std::filesystem::path fresh_dir(const std::string& leaf);

// Shared bookkeeping for sources created by a memory factory.
struct SourceLedger {
  std::vector<std::string> opened;  // open order
  std::size_t live{0};              // currently open sources
  std::size_t max_live{0};
  std::size_t closes{0};
  std::uint64_t bytes_served{0};
};

// Serves `head` followed by `filler_size` generated 'x' bytes, without materializing the filler.
// Any read once more than `budget` bytes have been served fails with io_failed.
class SyntheticSource final : public deltachain::io::ByteSource {
public:
  SyntheticSource(std::string name, std::string head, std::uint64_t filler_size,
                  std::size_t max_chunk, SourceLedger* ledger = nullptr,
                  std::uint64_t budget = std::numeric_limits<std::uint64_t>::max());
  ~SyntheticSource() override;

  auto read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, deltachain::core::error> override;
  void close() noexcept override;
  bool is_open() const noexcept override { return open_; }
  const std::string& name() const noexcept override { return name_; }

  std::uint64_t served() const noexcept { return pos_; }
  std::size_t read_calls() const noexcept { return read_calls_; }

private:
  std::string name_;
  std::string head_;
  std::uint64_t total_;
  std::size_t max_chunk_;
  SourceLedger* ledger_;
  std::uint64_t budget_;
  std::uint64_t pos_{0};
  std::size_t read_calls_{0};
  bool open_{true};
};

// In-memory "directory": name -> file content. Names absent from the map fail to open with not_found.
// Each opened source serves `filler` extra bytes after its content and is tracked in ledger.
deltachain::io::SourceFactory memory_factory(std::map<std::string, std::string> files,
                                             SourceLedger& ledger,
                                             std::size_t max_chunk = 7,
                                             std::uint64_t filler = 0);

} // namespace chain_test_helpers
