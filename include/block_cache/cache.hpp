#pragma once

#include "block_cache/options.hpp"
#include "block_cache/shard.hpp"
#include "block_cache/types.hpp"
#include "block_cache/value.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace block_cache {

struct Metrics {
  // Bytes held by resident (hot and cold) entries.
  std::int64_t size{0};
  // Number of entries, including test entries.
  std::int64_t count{0};
  std::int64_t hits{0};
  std::int64_t misses{0};
};

// Cache is a sharded CLOCK-Pro block cache. Each shard receives 1/n of the
// capacity and runs the algorithm independently, under its own lock.
//
// Blocks are keyed by (id, file, offset). The id namespaces file numbers so
// that one Cache can serve several storage engine instances; new_id() hands
// out fresh namespaces. Each shard also tracks the blocks of every file so
// that a deleted file can be evicted without scanning the shard.
//
// Values are manually managed. Every Handle returned by get() or set() holds
// a reference that is dropped by Handle::release() or the handle's
// destructor.
//
// The cache starts with one reference. Each additional owner calls ref() and
// every owner calls unref() exactly once; the last unref() frees all cached
// blocks.
class Cache {
public:
  explicit Cache(std::int64_t size);
  explicit Cache(const CacheOptions &opts);
  ~Cache();

  Cache(const Cache &) = delete;
  Cache &operator=(const Cache &) = delete;

  void ref();
  void unref();

  Handle get(ID id, FileNum file_num, std::uint64_t offset);

  // Inserts or replaces the block. The value must come from alloc_value and
  // must not have been added to a cache before. The returned handle owns the
  // value's initial reference and stays valid even if the block is too large
  // to be cached.
  Handle set(ID id, FileNum file_num, std::uint64_t offset, Value *value);

  void del(ID id, FileNum file_num, std::uint64_t offset);
  void evict_file(ID id, FileNum file_num);

  // Shrinks the cache by n bytes without consuming memory. The returned
  // function gives the bytes back and must be called exactly once. It holds
  // its own references to the shards, so calling it after the cache is gone
  // is harmless.
  std::function<void()> reserve(std::int64_t n);

  ID new_id();

  std::int64_t max_size() const { return max_size_; }
  std::int64_t size() const;
  Metrics metrics() const;
  std::vector<ShardStats> shard_stats() const;
  std::size_t shard_count() const { return shards_.size(); }
  std::string info() const;

  // Exposed for tests that need to inspect a block's category.
  const Shard &shard_for(ID id, FileNum file_num, std::uint64_t offset) const;

private:
  Shard &get_shard(ID id, FileNum file_num, std::uint64_t offset) const;
  void free_shards();

  std::atomic<std::int64_t> refs_{1};
  std::int64_t max_size_{0};
  std::atomic<std::uint64_t> id_alloc_{1};
  std::vector<std::shared_ptr<Shard>> shards_;
};

} // namespace block_cache
