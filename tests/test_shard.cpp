#include "block_cache/shard.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

using namespace block_cache;

namespace {
Value *make_value(std::size_t n, std::uint8_t fill) {
  Value *v = alloc_value(n);
  std::fill(v->buf().begin(), v->buf().end(), fill);
  return v;
}

Key key(FileNum file, std::uint64_t offset) { return Key{1, file, offset}; }
} // namespace

TEST_CASE("set then get returns the same buffer", "[shard][roundtrip]") {
  Shard s(1 << 20, true);
  auto h = s.set(key(1, 0), make_value(64, 7));
  REQUIRE(h.valid());

  auto g = s.get(key(1, 0));
  REQUIRE(g.valid());
  CHECK(g.raw_buffer().data() == h.raw_buffer().data());
  CHECK(std::all_of(g.raw_buffer().begin(), g.raw_buffer().end(),
                    [](std::uint8_t b) { return b == 7; }));

  const auto st = s.stats();
  CHECK(st.hits == 1);
  CHECK(st.misses == 0);
  CHECK(st.size_cold == 64);
  CHECK(st.count_cold == 1);
  CHECK(s.size() == 64);
  CHECK(s.count() == 1);
}

TEST_CASE("get on an absent key misses", "[shard]") {
  Shard s(1 << 20, true);
  auto h = s.get(key(1, 0));
  CHECK_FALSE(h.valid());
  CHECK(s.stats().misses == 1);
  CHECK(s.stats().hits == 0);
}

TEST_CASE("get marks the entry referenced without moving it", "[shard]") {
  Shard s(1 << 20, true);
  s.set(key(1, 0), make_value(8, 1)).release();
  REQUIRE(s.get(key(1, 0)).valid());
  CHECK(s.peek_type(key(1, 0)) == EntryType::Cold);
  CHECK_FALSE(s.peek_type(key(1, 1)).has_value());
}

TEST_CASE("delete is idempotent and frees after unlock", "[shard][delete]") {
  const auto before = value_stats();
  Shard s(1 << 20, true);

  s.del(key(1, 0));
  CHECK(s.count() == 0);

  auto h = s.set(key(1, 0), make_value(100, 3));
  s.del(key(1, 0));
  CHECK(s.count() == 0);
  CHECK(s.size() == 0);
  CHECK_FALSE(s.get(key(1, 0)).valid());

  // The handle still owns the buffer.
  REQUIRE(h.valid());
  CHECK(h.raw_buffer()[99] == 3);
  CHECK(value_stats().live == before.live + 1);
  h.release();
  CHECK(value_stats().live == before.live);

  s.del(key(1, 0));
  CHECK(s.count() == 0);
}

TEST_CASE("zero length blocks count without adding size", "[shard][empty]") {
  Shard s(1 << 20, true);
  s.set(key(1, 0), alloc_value(0)).release();
  s.set(key(1, 1), make_value(8, 1)).release();

  auto g = s.get(key(1, 0));
  REQUIRE(g.valid());
  CHECK(g.raw_buffer().empty());
  CHECK(s.count() == 2);
  CHECK(s.size() == 8);

  s.del(key(1, 1));
  const auto st = s.stats();
  CHECK(st.count_cold == 1);
  CHECK(st.size_cold == 0);
  s.del(key(1, 0));
  CHECK(s.count() == 0);
}

TEST_CASE("oversized values pass through uncached", "[shard][capacity]") {
  const auto before = value_stats();
  Shard s(1024, true);
  auto h = s.set(key(1, 0), make_value(2048, 9));
  REQUIRE(h.valid());
  CHECK(h.raw_buffer().size() == 2048);
  CHECK(h.raw_buffer()[2047] == 9);
  CHECK(s.count() == 0);
  CHECK(s.size() == 0);
  CHECK_FALSE(s.get(key(1, 0)).valid());
  h.release();
  CHECK(value_stats().live == before.live);
}

TEST_CASE("replacing a resident value adjusts size and frees the old value",
          "[shard][replace]") {
  const auto before = value_stats();
  Shard s(1 << 20, true);
  auto first = s.set(key(1, 0), make_value(100, 1));
  auto second = s.set(key(1, 0), make_value(300, 2));
  CHECK(s.size() == 300);
  CHECK(s.count() == 1);

  auto g = s.get(key(1, 0));
  REQUIRE(g.valid());
  CHECK(g.raw_buffer().size() == 300);
  CHECK(g.raw_buffer()[0] == 2);

  // Only the first handle keeps the old buffer alive now.
  CHECK(value_stats().live == before.live + 2);
  first.release();
  CHECK(value_stats().live == before.live + 1);
  second.release();
  g.release();
  s.free_all();
  CHECK(value_stats().live == before.live);
}

TEST_CASE("evict_file removes exactly one file's blocks", "[shard][file]") {
  const auto before = value_stats();
  Shard s(1 << 20, true);
  // More blocks than one batch so the lock is dropped and retaken.
  for (std::uint64_t off = 0; off < 23; ++off) {
    s.set(key(1, off), make_value(16, 1)).release();
    s.set(key(2, off), make_value(16, 2)).release();
  }
  s.set(Key{2, 1, 0}, make_value(16, 3)).release();
  REQUIRE(s.count() == 47);

  s.evict_file(key(1, 0));
  CHECK(s.count() == 24);
  for (std::uint64_t off = 0; off < 23; ++off) {
    CHECK_FALSE(s.get(key(1, off)).valid());
    CHECK(s.get(key(2, off)).valid());
  }
  // Same file number in another namespace is untouched.
  CHECK(s.get(Key{2, 1, 0}).valid());

  // Evicting a file with nothing cached is a no-op.
  s.evict_file(key(7, 0));
  CHECK(s.count() == 24);

  s.free_all();
  CHECK(value_stats().live == before.live);
}

TEST_CASE("reserve shrinks and restores the target size", "[shard][reserve]") {
  Shard s(64 * 1024, true);
  for (std::uint64_t i = 0; i < 16; ++i)
    s.set(key(1, i), make_value(4096, 1)).release();
  CHECK(s.stats().target_size == 64 * 1024);

  s.reserve(32 * 1024);
  auto st = s.stats();
  CHECK(st.target_size == 32 * 1024);
  CHECK(st.size_hot + st.size_cold <= 32 * 1024);
  CHECK(st.cold_target <= st.target_size);

  s.reserve(-32 * 1024);
  st = s.stats();
  CHECK(st.target_size == 64 * 1024);
  CHECK(st.reserved_size == 0);
}

TEST_CASE("reserving more than the shard keeps a positive target",
          "[shard][reserve]") {
  Shard s(4096, true);
  s.set(key(1, 0), make_value(100, 1)).release();
  s.reserve(1 << 20);
  const auto st = s.stats();
  CHECK(st.target_size == 1);
  CHECK(st.size_hot + st.size_cold == 0);
  CHECK(st.cold_target <= 1);
  s.reserve(-(1 << 20));
  CHECK(s.stats().target_size == 4096);
}

TEST_CASE("free_all releases every cached value", "[shard][teardown]") {
  const auto before = value_stats();
  Shard s(1 << 20, true);
  for (std::uint64_t i = 0; i < 50; ++i)
    s.set(key(i % 3, i), make_value(32, 1)).release();
  CHECK(value_stats().live == before.live + 50);
  s.free_all();
  CHECK(s.count() == 0);
  CHECK(s.size() == 0);
  CHECK(value_stats().live == before.live);
}
