#include "block_cache/cache.hpp"

#include <iostream>
#include <sstream>
#include <thread>

namespace block_cache {

Cache::Cache(std::int64_t size) : Cache(CacheOptions{size}) {}

Cache::Cache(const CacheOptions &opts) : max_size_(opts.size) {
  // More shards reduce contention, but a shard smaller than a frequently
  // scanned file cannot keep that file resident even when other shards hold
  // cold data.
  std::size_t n = opts.shards;
  if (n == 0)
    n = shard_count_for(opts.size, std::thread::hardware_concurrency());
  shards_.reserve(n);
  const auto per_shard = opts.size / static_cast<std::int64_t>(n);
  for (std::size_t i = 0; i < n; ++i)
    shards_.push_back(
        std::make_shared<Shard>(per_shard, opts.verify_consistency));
}

Cache::~Cache() {
  if (const auto v = refs_.load(); v != 0) {
    std::cerr << "block_cache: cache destroyed with non-zero reference count: "
              << v << std::endl;
    free_shards();
  }
}

Shard &Cache::get_shard(ID id, FileNum file_num, std::uint64_t offset) const {
  if (id == 0)
    fatal("0 cache ID is invalid");
  const auto h = hash_key(id, file_num, offset);
  return *shards_[h % shards_.size()];
}

const Shard &Cache::shard_for(ID id, FileNum file_num,
                              std::uint64_t offset) const {
  return get_shard(id, file_num, offset);
}

void Cache::ref() {
  const auto v = refs_.fetch_add(1) + 1;
  if (v <= 1)
    fatal("inconsistent reference count: " + std::to_string(v));
}

void Cache::unref() {
  const auto v = refs_.fetch_sub(1) - 1;
  if (v < 0)
    fatal("inconsistent reference count: " + std::to_string(v));
  if (v == 0)
    free_shards();
}

void Cache::free_shards() {
  for (auto &s : shards_)
    s->free_all();
}

Handle Cache::get(ID id, FileNum file_num, std::uint64_t offset) {
  return get_shard(id, file_num, offset).get(Key{id, file_num, offset});
}

Handle Cache::set(ID id, FileNum file_num, std::uint64_t offset,
                  Value *value) {
  return get_shard(id, file_num, offset)
      .set(Key{id, file_num, offset}, value);
}

void Cache::del(ID id, FileNum file_num, std::uint64_t offset) {
  get_shard(id, file_num, offset).del(Key{id, file_num, offset});
}

void Cache::evict_file(ID id, FileNum file_num) {
  if (id == 0)
    fatal("0 cache ID is invalid");
  // A file's blocks are spread over every shard.
  const Key file_key{id, file_num, 0};
  for (auto &s : shards_)
    s->evict_file(file_key);
}

std::function<void()> Cache::reserve(std::int64_t n) {
  // Round the per-shard reservation up. Reservations are expected to be
  // large, so the rounding is immaterial.
  const auto count = static_cast<std::int64_t>(shards_.size());
  const std::int64_t shard_n = (n + count - 1) / count;
  for (auto &s : shards_)
    s->reserve(shard_n);

  auto released = std::make_shared<std::atomic<bool>>(false);
  return [shards = shards_, shard_n, released]() {
    if (released->exchange(true))
      fatal("cache reservation already released");
    for (const auto &s : shards)
      s->reserve(-shard_n);
  };
}

ID Cache::new_id() { return id_alloc_.fetch_add(1) + 1; }

std::int64_t Cache::size() const {
  std::int64_t size = 0;
  for (const auto &s : shards_)
    size += s->size();
  return size;
}

Metrics Cache::metrics() const {
  Metrics m;
  for (const auto &s : shards_) {
    const auto st = s->stats();
    m.size += st.size_hot + st.size_cold;
    m.count += st.count_hot + st.count_cold + st.count_test;
    m.hits += st.hits;
    m.misses += st.misses;
  }
  return m;
}

std::vector<ShardStats> Cache::shard_stats() const {
  std::vector<ShardStats> out;
  out.reserve(shards_.size());
  for (const auto &s : shards_)
    out.push_back(s->stats());
  return out;
}

std::string Cache::info() const {
  ShardStats total;
  for (const auto &st : shard_stats()) {
    total.target_size += st.target_size;
    total.reserved_size += st.reserved_size;
    total.cold_target += st.cold_target;
    total.size_hot += st.size_hot;
    total.size_cold += st.size_cold;
    total.size_test += st.size_test;
    total.count_hot += st.count_hot;
    total.count_cold += st.count_cold;
    total.count_test += st.count_test;
    total.hits += st.hits;
    total.misses += st.misses;
  }
  const auto lookups = total.hits + total.misses;

  std::ostringstream os;
  os << "shards:" << shards_.size() << "\n";
  os << "max_size_bytes:" << max_size_ << "\n";
  os << "target_size_bytes:" << total.target_size << "\n";
  os << "reserved_bytes:" << total.reserved_size << "\n";
  os << "cold_target_bytes:" << total.cold_target << "\n";
  os << "size_bytes:" << (total.size_hot + total.size_cold) << "\n";
  os << "hot_bytes:" << total.size_hot << "\n";
  os << "cold_bytes:" << total.size_cold << "\n";
  os << "test_bytes:" << total.size_test << "\n";
  os << "hot_count:" << total.count_hot << "\n";
  os << "cold_count:" << total.count_cold << "\n";
  os << "test_count:" << total.count_test << "\n";
  os << "hits:" << total.hits << "\n";
  os << "misses:" << total.misses << "\n";
  os << "hit_rate:"
     << (lookups == 0 ? 0.0
                      : static_cast<double>(total.hits) /
                            static_cast<double>(lookups))
     << "\n";
  os << "refs:" << refs_.load() << "\n";
  return os.str();
}

} // namespace block_cache
