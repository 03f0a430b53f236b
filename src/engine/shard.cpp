#include "block_cache/shard.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace block_cache {
namespace {
// Evicting every block of a large file can take a while. The shard lock is
// dropped after this many blocks so concurrent readers can make progress.
constexpr int kBlocksPerMutexAcquisition = 5;
} // namespace

Shard::Shard(std::int64_t max_size, bool verify_consistency)
    : verify_(verify_consistency), max_size_(max_size),
      cold_target_(max_size) {}

Shard::~Shard() { free_all(); }

Handle Shard::get(const Key &k) {
  Value *value = nullptr;
  {
    std::shared_lock lock(mu_);
    auto it = blocks_.find(k);
    if (it != blocks_.end()) {
      Entry &e = arena_.get(it->second);
      value = e.acquire_value();
      if (value != nullptr)
        e.referenced.store(true, std::memory_order_relaxed);
    }
  }
  if (value == nullptr) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return Handle();
  }
  hits_.fetch_add(1, std::memory_order_relaxed);
  return Handle(value);
}

Handle Shard::set(const Key &k, Value *value) {
  if (const auto n = value->refs(); n != 1)
    fatal("value has already been added to the cache: refs=" +
          std::to_string(n));

  const auto size = static_cast<std::int64_t>(value->size());
  std::vector<Value *> obsolete;
  {
    std::unique_lock lock(mu_);
    auto it = blocks_.find(k);

    if (it == blocks_.end()) {
      // New key: admit as cold.
      const EntryIndex e = arena_.allocate(k, size);
      defer_release(arena_.get(e).set_value(value));
      if (meta_add(k, e)) {
        size_cold_ += size;
        ++count_cold_;
      } else {
        defer_release(arena_.get(e).set_value(nullptr));
        arena_.free(e);
      }
    } else if (arena_.get(it->second).val != nullptr) {
      // Resident hot or cold page: swap the value in place.
      Entry &e = arena_.get(it->second);
      defer_release(e.set_value(value));
      e.referenced.store(true, std::memory_order_relaxed);
      const std::int64_t delta = size - e.size;
      e.size = size;
      if (e.type == EntryType::Hot)
        size_hot_ += delta;
      else
        size_cold_ += delta;
      evict();
    } else {
      // Test page: the key was evicted while it still had reuse. Give the
      // cold region more room and bring the key back as hot.
      const EntryIndex e = it->second;
      Entry &n = arena_.get(e);
      size_test_ -= n.size;
      --count_test_;
      defer_release(meta_del(e));
      meta_check(e);

      n.size = size;
      cold_target_ = std::min(cold_target_ + size, target_size());

      n.referenced.store(false, std::memory_order_relaxed);
      defer_release(n.set_value(value));
      n.type = EntryType::Hot;
      if (meta_add(k, e)) {
        size_hot_ += size;
        ++count_hot_;
      } else {
        defer_release(n.set_value(nullptr));
        arena_.free(e);
      }
    }

    // meta_add only makes room before linking, so a large insert can leave
    // the shard over budget.
    if (target_size() < size_hot_ + size_cold_)
      evict();

    check_consistency();
    obsolete = take_obsolete();
  }
  release_all(obsolete);

  // The value's initial reference is transferred to the returned handle.
  return Handle(value);
}

void Shard::del(const Key &k) {
  // Most deletes find nothing, so check under the shared lock first.
  {
    std::shared_lock lock(mu_);
    if (!blocks_.contains(k))
      return;
  }

  Value *deleted = nullptr;
  {
    std::unique_lock lock(mu_);
    auto it = blocks_.find(k);
    if (it == blocks_.end())
      return;
    deleted = meta_evict(it->second);
    check_consistency();
  }
  // Freeing may be expensive, so it happens after the lock is dropped.
  if (deleted != nullptr)
    deleted->release();
}

void Shard::evict_file(const Key &file_key) {
  while (evict_file_run(file_key))
    std::this_thread::yield();
}

bool Shard::evict_file_run(const Key &file_key) {
  std::vector<Value *> obsolete;
  obsolete.reserve(kBlocksPerMutexAcquisition);
  bool more = false;
  {
    std::unique_lock lock(mu_);
    auto it = files_.find(file_key);
    if (it != files_.end()) {
      more = true;
      EntryIndex b = it->second;
      for (int evicted = 0; evicted < kBlocksPerMutexAcquisition; ++evicted) {
        const EntryIndex n = arena_.next(Ring::File, b);
        if (Value *v = meta_evict(b); v != nullptr)
          obsolete.push_back(v);
        if (b == n) {
          // b pointed at itself: it was the file's last block.
          check_consistency();
          more = false;
          break;
        }
        b = n;
      }
    }
  }
  release_all(obsolete);
  return more;
}

void Shard::reserve(std::int64_t n) {
  std::vector<Value *> obsolete;
  {
    std::unique_lock lock(mu_);
    reserved_size_ += n;

    // A smaller target must not leave cold_target_ outside [0, target].
    cold_target_ = std::min(cold_target_, target_size());

    evict();
    check_consistency();
    obsolete = take_obsolete();
  }
  release_all(obsolete);
}

void Shard::free_all() {
  std::vector<Value *> obsolete;
  {
    std::unique_lock lock(mu_);
    while (hand_hot_ != kNoEntry) {
      const EntryIndex e = hand_hot_;
      defer_release(meta_del(e));
      arena_.free(e);
    }
    blocks_.clear();
    files_.clear();
    size_hot_ = size_cold_ = size_test_ = 0;
    count_hot_ = count_cold_ = count_test_ = 0;
    obsolete = take_obsolete();
  }
  release_all(obsolete);
}

std::int64_t Shard::size() const {
  std::shared_lock lock(mu_);
  return size_hot_ + size_cold_;
}

std::int64_t Shard::count() const {
  std::shared_lock lock(mu_);
  return static_cast<std::int64_t>(blocks_.size());
}

ShardStats Shard::stats() const {
  ShardStats s;
  {
    std::shared_lock lock(mu_);
    s.max_size = max_size_;
    s.reserved_size = reserved_size_;
    s.target_size = target_size();
    s.cold_target = cold_target_;
    s.size_hot = size_hot_;
    s.size_cold = size_cold_;
    s.size_test = size_test_;
    s.count_hot = count_hot_;
    s.count_cold = count_cold_;
    s.count_test = count_test_;
  }
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  return s;
}

std::optional<EntryType> Shard::peek_type(const Key &k) const {
  std::shared_lock lock(mu_);
  auto it = blocks_.find(k);
  if (it == blocks_.end())
    return std::nullopt;
  return arena_.get(it->second).type;
}

std::int64_t Shard::target_size() const {
  // Never zero or negative, otherwise evict() would spin forever once the
  // reservations reach max_size_.
  return std::max<std::int64_t>(1, max_size_ - reserved_size_);
}

bool Shard::meta_add(const Key &k, EntryIndex e) {
  evict();
  if (arena_.get(e).size > target_size())
    return false;

  blocks_.insert_or_assign(k, e);

  if (hand_hot_ == kNoEntry) {
    hand_hot_ = e;
    hand_cold_ = e;
    hand_test_ = e;
  } else {
    arena_.link(Ring::Blocks, hand_hot_, e);
  }

  if (hand_cold_ == hand_hot_)
    hand_cold_ = arena_.prev(Ring::Blocks, hand_cold_);

  const Key file_key = k.file();
  if (auto it = files_.find(file_key); it == files_.end())
    files_.emplace(file_key, e);
  else
    arena_.link(Ring::File, it->second, e);
  return true;
}

// Unlinks e from both maps and both rings and moves any hand off it. Returns
// the value e held, whose reference the caller must release.
Value *Shard::meta_del(EntryIndex e) {
  Entry &n = arena_.get(e);
  Value *deleted = n.val;
  n.val = nullptr;

  blocks_.erase(n.key);

  if (e == hand_hot_)
    hand_hot_ = arena_.prev(Ring::Blocks, hand_hot_);
  if (e == hand_cold_)
    hand_cold_ = arena_.prev(Ring::Blocks, hand_cold_);
  if (e == hand_test_)
    hand_test_ = arena_.prev(Ring::Blocks, hand_test_);

  if (arena_.unlink(Ring::Blocks, e) == e) {
    // That was the last entry in the shard.
    hand_hot_ = kNoEntry;
    hand_cold_ = kNoEntry;
    hand_test_ = kNoEntry;
  }

  const Key file_key = n.key.file();
  if (const EntryIndex next = arena_.unlink(Ring::File, e); next == e)
    files_.erase(file_key);
  else
    files_.insert_or_assign(file_key, next);
  return deleted;
}

Value *Shard::meta_evict(EntryIndex e) {
  const Entry &n = arena_.get(e);
  switch (n.type) {
  case EntryType::Hot:
    size_hot_ -= n.size;
    --count_hot_;
    break;
  case EntryType::Cold:
    size_cold_ -= n.size;
    --count_cold_;
    break;
  case EntryType::Test:
    size_test_ -= n.size;
    --count_test_;
    break;
  }
  Value *evicted = meta_del(e);
  meta_check(e);
  arena_.free(e);
  return evicted;
}

// Verifies that e is no longer reachable from the shard and that the tracked
// statistics match a full walk of the ring.
void Shard::meta_check(EntryIndex e) const {
  if (!verify_)
    return;
  const Entry &n = arena_.get(e);
  for (const auto &[k, v] : blocks_) {
    if (v == e)
      fatal(key_string(n.key) + " unexpectedly found in blocks map");
  }
  for (const auto &[k, v] : files_) {
    if (v == e)
      fatal(key_string(n.key) + " unexpectedly found in files map");
  }

  std::int64_t count_hot = 0, count_cold = 0, count_test = 0;
  std::int64_t size_hot = 0, size_cold = 0, size_test = 0;
  for (EntryIndex t = arena_.next(Ring::Blocks, hand_hot_); t != kNoEntry;
       t = arena_.next(Ring::Blocks, t)) {
    const Entry &te = arena_.get(t);
    switch (te.type) {
    case EntryType::Hot:
      ++count_hot;
      size_hot += te.size;
      break;
    case EntryType::Cold:
      ++count_cold;
      size_cold += te.size;
      break;
    case EntryType::Test:
      ++count_test;
      size_test += te.size;
      break;
    }
    if (t == e)
      fatal(key_string(n.key) + " unexpectedly found in blocks list");
    if (t == hand_hot_)
      break;
  }
  if (count_hot != count_hot_ || count_cold != count_cold_ ||
      count_test != count_test_ || size_hot != size_hot_ ||
      size_cold != size_cold_ || size_test != size_test_) {
    std::ostringstream os;
    os << "divergence of hot,cold,test statistics: tracked hot " << count_hot_
       << ", " << size_hot_ << " cold " << count_cold_ << ", " << size_cold_
       << " test " << count_test_ << ", " << size_test_
       << "; recounted hot " << count_hot << ", " << size_hot << " cold "
       << count_cold << ", " << size_cold << " test " << count_test << ", "
       << size_test;
    fatal(os.str());
  }
}

void Shard::check_consistency() const {
  if (size_hot_ < 0 || size_cold_ < 0 || size_test_ < 0 || count_hot_ < 0 ||
      count_cold_ < 0 || count_test_ < 0) {
    std::ostringstream os;
    os << "unexpected negative: " << count_hot_ << " (" << size_hot_
       << " bytes) hot, " << count_cold_ << " (" << size_cold_
       << " bytes) cold, " << count_test_ << " (" << size_test_
       << " bytes) test";
    fatal(os.str());
  }
  if (size_hot_ > 0 && count_hot_ == 0)
    fatal("mismatch " + std::to_string(size_hot_) + " hot size, " +
          std::to_string(count_hot_) + " hot count");
  if (size_cold_ > 0 && count_cold_ == 0)
    fatal("mismatch " + std::to_string(size_cold_) + " cold size, " +
          std::to_string(count_cold_) + " cold count");
  if (size_test_ > 0 && count_test_ == 0)
    fatal("mismatch " + std::to_string(size_test_) + " test size, " +
          std::to_string(count_test_) + " test count");
}

void Shard::evict() {
  while (target_size() <= size_hot_ + size_cold_ && hand_cold_ != kNoEntry)
    run_hands();
}

// Moves the cold hand one step, together with every hot and test hand step
// that movement requires. Each HandStep stands for one hand movement in
// progress; phase records how far that movement has got.
//
// cold: 0 classify the entry, 1 trim test entries after a demotion,
//       2 advance, 3 age hot entries until the hot region fits.
// hot:  0 let the test hand pass first, 1 classify and advance.
// test: 0 let the cold hand pass first, 1 drop a test entry and advance.
void Shard::run_hands() {
  hand_steps_.clear();
  hand_steps_.push_back({Hand::Cold, 0});
  while (!hand_steps_.empty()) {
    HandStep &s = hand_steps_.back();
    switch (s.hand) {
    case Hand::Cold:
      switch (s.phase) {
      case 0:
        s.phase = step_cold() ? 1 : 2;
        break;
      case 1:
        if (target_size() < size_test_ && hand_test_ != kNoEntry)
          hand_steps_.push_back({Hand::Test, 0});
        else
          s.phase = 2;
        break;
      case 2:
        hand_cold_ = arena_.next(Ring::Blocks, hand_cold_);
        s.phase = 3;
        break;
      default:
        if (target_size() - cold_target_ <= size_hot_ &&
            hand_hot_ != kNoEntry)
          hand_steps_.push_back({Hand::Hot, 0});
        else
          hand_steps_.pop_back();
        break;
      }
      break;

    case Hand::Hot:
      if (s.phase == 0) {
        s.phase = 1;
        if (hand_hot_ == hand_test_ && hand_test_ != kNoEntry)
          hand_steps_.push_back({Hand::Test, 0});
      } else {
        hand_steps_.pop_back();
        if (hand_hot_ != kNoEntry)
          step_hot();
      }
      break;

    case Hand::Test:
      if (s.phase == 0) {
        s.phase = 1;
        if (size_cold_ > 0 && hand_test_ == hand_cold_ &&
            hand_cold_ != kNoEntry) {
          if (count_cold_ == 0)
            fatal("mismatch " + std::to_string(size_cold_) + " cold size, " +
                  std::to_string(count_cold_) + " cold count");
          hand_steps_.push_back({Hand::Cold, 0});
        }
      } else {
        hand_steps_.pop_back();
        if (hand_test_ != kNoEntry)
          step_test();
      }
      break;
    }
  }
}

// Classifies the entry under the cold hand. Returns true if a cold entry was
// demoted to a test entry.
bool Shard::step_cold() {
  Entry &e = arena_.get(hand_cold_);
  if (e.type != EntryType::Cold)
    return false;
  if (e.referenced.load(std::memory_order_relaxed)) {
    e.referenced.store(false, std::memory_order_relaxed);
    e.type = EntryType::Hot;
    size_cold_ -= e.size;
    --count_cold_;
    size_hot_ += e.size;
    ++count_hot_;
    return false;
  }
  defer_release(e.set_value(nullptr));
  e.type = EntryType::Test;
  size_cold_ -= e.size;
  --count_cold_;
  size_test_ += e.size;
  ++count_test_;
  return true;
}

void Shard::step_hot() {
  Entry &e = arena_.get(hand_hot_);
  if (e.type == EntryType::Hot) {
    if (e.referenced.load(std::memory_order_relaxed)) {
      e.referenced.store(false, std::memory_order_relaxed);
    } else {
      e.type = EntryType::Cold;
      size_hot_ -= e.size;
      --count_hot_;
      size_cold_ += e.size;
      ++count_cold_;
    }
  }
  hand_hot_ = arena_.next(Ring::Blocks, hand_hot_);
}

void Shard::step_test() {
  const EntryIndex e = hand_test_;
  const Entry &n = arena_.get(e);
  if (n.type == EntryType::Test) {
    size_test_ -= n.size;
    --count_test_;
    cold_target_ = std::max<std::int64_t>(0, cold_target_ - n.size);
    defer_release(meta_del(e));
    meta_check(e);
    arena_.free(e);
  }
  hand_test_ = arena_.next(Ring::Blocks, hand_test_);
}

void Shard::defer_release(Value *v) {
  if (v != nullptr)
    obsolete_.push_back(v);
}

std::vector<Value *> Shard::take_obsolete() {
  std::vector<Value *> out;
  out.swap(obsolete_);
  return out;
}

void Shard::release_all(std::vector<Value *> &values) {
  for (Value *v : values)
    v->release();
  values.clear();
}

} // namespace block_cache
