#include "block_cache/entry.hpp"

#include <string>

namespace block_cache {

EntryIndex EntryArena::allocate(const Key &key, std::int64_t size) {
  EntryIndex e;
  if (!free_.empty()) {
    e = free_.back();
    free_.pop_back();
  } else {
    if (slots_.size() >= kNoEntry)
      fatal("entry arena exhausted");
    e = static_cast<EntryIndex>(slots_.size());
    slots_.emplace_back();
  }
  Entry &n = slots_[e];
  n.key = key;
  n.size = size;
  n.type = EntryType::Cold;
  n.referenced.store(false, std::memory_order_relaxed);
  n.val = nullptr;
  for (auto &l : n.links) {
    l.next = e;
    l.prev = e;
  }
  return e;
}

void EntryArena::free(EntryIndex e) {
  Entry &n = slots_[e];
  if (n.val != nullptr)
    fatal("entry " + key_string(n.key) + " freed while holding a value");
  for (auto &l : n.links) {
    l.next = kNoEntry;
    l.prev = kNoEntry;
  }
  free_.push_back(e);
}

EntryIndex EntryArena::next(Ring r, EntryIndex e) const {
  if (e == kNoEntry)
    return kNoEntry;
  return slots_[e].links[ring(r)].next;
}

EntryIndex EntryArena::prev(Ring r, EntryIndex e) const {
  if (e == kNoEntry)
    return kNoEntry;
  return slots_[e].links[ring(r)].prev;
}

void EntryArena::link(Ring r, EntryIndex e, EntryIndex s) {
  const int i = ring(r);
  Link &sl = slots_[s].links[i];
  sl.prev = slots_[e].links[i].prev;
  slots_[sl.prev].links[i].next = s;
  sl.next = e;
  slots_[e].links[i].prev = s;
}

EntryIndex EntryArena::unlink(Ring r, EntryIndex e) {
  const int i = ring(r);
  Link &el = slots_[e].links[i];
  const EntryIndex next = el.next;
  slots_[el.prev].links[i].next = el.next;
  slots_[el.next].links[i].prev = el.prev;
  el.prev = e;
  el.next = e;
  return next;
}

} // namespace block_cache
