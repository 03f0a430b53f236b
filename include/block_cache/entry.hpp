#pragma once

#include "block_cache/types.hpp"
#include "block_cache/value.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <limits>
#include <vector>

namespace block_cache {

using EntryIndex = std::uint32_t;
constexpr EntryIndex kNoEntry = std::numeric_limits<EntryIndex>::max();

// The two circular lists an entry belongs to: the shard-wide clock and the
// list of blocks cached for the same file.
enum class Ring : std::uint8_t { Blocks = 0, File = 1 };

struct Link {
  EntryIndex next{kNoEntry};
  EntryIndex prev{kNoEntry};
};

struct Entry {
  Key key;
  std::int64_t size{0};
  EntryType type{EntryType::Cold};
  std::atomic<bool> referenced{false};
  Link links[2];
  // Null for test entries.
  Value *val{nullptr};

  // Takes a new reference on the value, or returns null for a test entry.
  // Only called with the shard lock held.
  Value *acquire_value() const {
    Value *v = val;
    if (v != nullptr)
      v->acquire();
    return v;
  }

  // Stores v, taking a reference on it. Returns the previous value, whose
  // reference now belongs to the caller.
  Value *set_value(Value *v) {
    if (v != nullptr)
      v->acquire();
    Value *old = val;
    val = v;
    return old;
  }
};

// EntryArena owns the entries of one shard. Entries are addressed by stable
// indices; freed slots are recycled. All methods require the shard's
// exclusive lock except get(), which may run under the shared lock.
class EntryArena {
public:
  EntryIndex allocate(const Key &key, std::int64_t size);
  void free(EntryIndex e);

  Entry &get(EntryIndex e) { return slots_[e]; }
  const Entry &get(EntryIndex e) const { return slots_[e]; }

  EntryIndex next(Ring r, EntryIndex e) const;
  EntryIndex prev(Ring r, EntryIndex e) const;

  // Inserts s into the ring just before e.
  void link(Ring r, EntryIndex e, EntryIndex s);

  // Removes e from the ring, leaving it linked to itself. Returns e's former
  // successor, which is e itself if e was the only node.
  EntryIndex unlink(Ring r, EntryIndex e);

  std::size_t live() const { return slots_.size() - free_.size(); }

private:
  static int ring(Ring r) { return static_cast<int>(r); }

  // std::deque never relocates existing elements on growth, which Entry's
  // atomic member requires.
  std::deque<Entry> slots_;
  std::vector<EntryIndex> free_;
};

} // namespace block_cache
