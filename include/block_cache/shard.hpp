#pragma once

#include "block_cache/entry.hpp"
#include "block_cache/types.hpp"
#include "block_cache/value.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace block_cache {

struct ShardStats {
  std::int64_t max_size{0};
  std::int64_t reserved_size{0};
  std::int64_t target_size{0};
  std::int64_t cold_target{0};
  std::int64_t size_hot{0};
  std::int64_t size_cold{0};
  std::int64_t size_test{0};
  std::int64_t count_hot{0};
  std::int64_t count_cold{0};
  std::int64_t count_test{0};
  std::int64_t hits{0};
  std::int64_t misses{0};
};

// Shard is one independent CLOCK-Pro instance. Hot, cold and test entries
// share a single ring; three hands sweep it. Get only sets the reference bit,
// every state transition happens while evicting.
class Shard {
public:
  explicit Shard(std::int64_t max_size, bool verify_consistency = false);
  ~Shard();

  Shard(const Shard &) = delete;
  Shard &operator=(const Shard &) = delete;

  Handle get(const Key &k);
  Handle set(const Key &k, Value *value);
  void del(const Key &k);
  void evict_file(const Key &file_key);
  void reserve(std::int64_t n);

  // Removes every entry. Used when the owning cache loses its last reference.
  void free_all();

  std::int64_t size() const;
  std::int64_t count() const;
  ShardStats stats() const;
  std::optional<EntryType> peek_type(const Key &k) const;

private:
  std::int64_t target_size() const;

  bool meta_add(const Key &k, EntryIndex e);
  Value *meta_del(EntryIndex e);
  Value *meta_evict(EntryIndex e);
  void meta_check(EntryIndex e) const;
  void check_consistency() const;

  bool evict_file_run(const Key &file_key);

  void evict();
  void run_hands();
  bool step_cold();
  void step_hot();
  void step_test();

  // Values dropped under the lock are parked here and released by the caller
  // once the lock is gone.
  void defer_release(Value *v);
  std::vector<Value *> take_obsolete();
  static void release_all(std::vector<Value *> &values);

  std::atomic<std::int64_t> hits_{0};
  std::atomic<std::int64_t> misses_{0};

  mutable std::shared_mutex mu_;

  const bool verify_;
  std::int64_t reserved_size_{0};
  std::int64_t max_size_{0};
  std::int64_t cold_target_{0};

  EntryArena arena_;
  std::unordered_map<Key, EntryIndex, KeyHash> blocks_;
  std::unordered_map<Key, EntryIndex, KeyHash> files_;
  std::vector<Value *> obsolete_;

  // Pending hand movements. Moving one hand can require moving another, and
  // the chain can be as long as the ring, so it lives on the heap.
  enum class Hand : std::uint8_t { Cold, Hot, Test };
  struct HandStep {
    Hand hand;
    int phase;
  };
  std::vector<HandStep> hand_steps_;

  EntryIndex hand_hot_{kNoEntry};
  EntryIndex hand_cold_{kNoEntry};
  EntryIndex hand_test_{kNoEntry};

  std::int64_t size_hot_{0};
  std::int64_t size_cold_{0};
  std::int64_t size_test_{0};

  // The counts exist so that a corrupted size can be caught by
  // check_consistency instead of turning into an endless eviction loop.
  std::int64_t count_hot_{0};
  std::int64_t count_cold_{0};
  std::int64_t count_test_{0};
};

} // namespace block_cache
