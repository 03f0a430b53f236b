#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace block_cache {

struct CacheOptions {
  std::int64_t size{64 * 1024 * 1024};
  // 0 picks the shard count from the number of CPUs.
  std::size_t shards{0};
  // Recount the whole ring after every removal. Slow; meant for tests and
  // debugging.
  bool verify_consistency{false};
};

// Shards never drop below this size unless that would leave fewer than four.
constexpr std::int64_t kMinimumShardSize = 4 << 20;

// 4 shards per CPU, or 4 shards if that split makes shards smaller than
// kMinimumShardSize.
std::size_t shard_count_for(std::int64_t size, std::size_t cpus);

// Reads a flat JSON object with the keys "size", "shards" and
// "verify_consistency". On failure `opts` is left untouched.
bool load_options(const std::string &path, CacheOptions &opts,
                  std::string *err = nullptr);

} // namespace block_cache
