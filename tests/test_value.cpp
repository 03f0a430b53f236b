#include "block_cache/shard.hpp"
#include "block_cache/value.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <type_traits>
#include <utility>

using namespace block_cache;

// Only the cache hands out references.
static_assert(!std::is_constructible_v<Handle, Value *>);

namespace {
// A one byte shard cannot cache anything, so the returned handle holds the
// value's only reference.
Handle uncached(std::size_t n) {
  Shard s(1);
  return s.set(Key{1, 1, 0}, alloc_value(n));
}
} // namespace

TEST_CASE("alloc_value returns an unshared writable buffer", "[value]") {
  const auto before = value_stats();
  Value *v = alloc_value(128);
  REQUIRE(v != nullptr);
  CHECK(v->refs() == 1);
  CHECK(v->size() == 128);
  CHECK(v->buf().size() == 128);
  std::fill(v->buf().begin(), v->buf().end(), 0xAB);
  CHECK(v->buf()[127] == 0xAB);

  const auto during = value_stats();
  CHECK(during.live == before.live + 1);
  CHECK(during.bytes == before.bytes + 128);

  free_value(v);
  const auto after = value_stats();
  CHECK(after.live == before.live);
  CHECK(after.bytes == before.bytes);
}

TEST_CASE("zero length values are allowed", "[value]") {
  const auto before = value_stats();
  Value *v = alloc_value(0);
  CHECK(v->buf().empty());
  free_value(v);
  CHECK(value_stats().live == before.live);
}

TEST_CASE("handle owns exactly one reference", "[value][handle]") {
  const auto before = value_stats();
  {
    Handle h = uncached(16);
    REQUIRE(h.valid());
    CHECK(h.raw_buffer().size() == 16);

    Handle moved(std::move(h));
    CHECK_FALSE(h.valid());
    CHECK(moved.valid());

    Handle assigned;
    CHECK_FALSE(assigned.valid());
    assigned = std::move(moved);
    CHECK(assigned.valid());
    CHECK(value_stats().live == before.live + 1);

    assigned.release();
    CHECK_FALSE(assigned.valid());
    CHECK(value_stats().live == before.live);

    // Releasing an empty handle does nothing.
    assigned.release();
    h.release();
  }
  CHECK(value_stats().live == before.live);
}

TEST_CASE("handle destructor releases an unreleased reference",
          "[value][handle]") {
  const auto before = value_stats();
  {
    Handle h = uncached(32);
    CHECK(value_stats().live == before.live + 1);
  }
  CHECK(value_stats().live == before.live);
  CHECK(value_stats().bytes == before.bytes);
}
