#include <catch2/catch_all.hpp>
#include <deltachain/io/byte_source.hpp>

#include <array>
#include <filesystem>
#include <fstream>

#include <tests/support/chain_test_helpers.hpp>

using namespace deltachain;

TEST_CASE("FileByteSource reads sequentially and releases on close", "[io][file]") {
  namespace fs = std::filesystem;
  auto dir = chain_test_helpers::fresh_dir("deltachain_byte_source");
  { std::ofstream(dir / "a.sql", std::ios::binary) << "abcdef"; }

  auto src = io::FileByteSource::open(dir / "a.sql");
  REQUIRE(src.has_value());
  REQUIRE((*src)->is_open());
  REQUIRE((*src)->name() == (dir / "a.sql").string());

  std::array<std::uint8_t, 4> buf{};
  auto n = (*src)->read(buf);
  REQUIRE(n.has_value());
  REQUIRE(*n == 4);
  REQUIRE(buf[0] == 'a');
  n = (*src)->read(buf);
  REQUIRE(n.has_value());
  REQUIRE(*n == 2);
  n = (*src)->read(buf);
  REQUIRE(n.has_value());
  REQUIRE(*n == 0);

  (*src)->close();
  REQUIRE_FALSE((*src)->is_open());
  (*src)->close(); // idempotent
  auto after = (*src)->read(buf);
  REQUIRE_FALSE(after.has_value());
  REQUIRE(after.error().code == core::error_code::io_failed);

  std::error_code ec; fs::remove_all(dir, ec);
}

TEST_CASE("FileByteSource open failure is a source read error", "[io][file]") {
  auto dir = chain_test_helpers::fresh_dir("deltachain_byte_source_missing");
  auto src = io::FileByteSource::open(dir / "nope.sql");
  REQUIRE_FALSE(src.has_value());
  REQUIRE(src.error().code == core::error_code::not_found);
  REQUIRE(core::is_source_read_error(src.error().code));
  REQUIRE(src.error().component == "io.file");

  auto factory = io::directory_source_factory(dir);
  auto viaf = factory("nope.sql");
  REQUIRE_FALSE(viaf.has_value());
  REQUIRE(viaf.error().code == core::error_code::not_found);
}

TEST_CASE("MemoryByteSource honours the chunk limit", "[io][memory]") {
  io::MemoryByteSource src("hello world", 3);
  std::array<std::uint8_t, 16> buf{};
  auto n = src.read(buf);
  REQUIRE(n.has_value());
  REQUIRE(*n == 3);
  REQUIRE(src.bytes_served() == 3);
  src.close();
  REQUIRE_FALSE(src.read(buf).has_value());
}
