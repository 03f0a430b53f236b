#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

namespace block_cache {

class Shard;

// Value is a manually managed, reference counted byte buffer. The header and
// the payload share one allocation. A Value starts with one reference; the
// memory is returned to the allocator when the count drops to zero.
class Value {
public:
  Value(const Value &) = delete;
  Value &operator=(const Value &) = delete;

  std::span<std::uint8_t> buf() { return {data(), size_}; }
  std::span<const std::uint8_t> buf() const { return {data(), size_}; }
  std::size_t size() const { return size_; }
  std::int32_t refs() const { return refs_.load(std::memory_order_acquire); }

private:
  friend Value *alloc_value(std::size_t n);
  friend void free_value(Value *v);
  friend class Handle;
  friend class Shard;
  friend struct Entry;

  explicit Value(std::size_t n) : size_(n) {}
  ~Value() = default;

  void acquire();
  void release();

  std::uint8_t *data() { return reinterpret_cast<std::uint8_t *>(this + 1); }
  const std::uint8_t *data() const {
    return reinterpret_cast<const std::uint8_t *>(this + 1);
  }

  std::atomic<std::int32_t> refs_{1};
  std::size_t size_{0};
};

// Allocates a Value of n bytes. The caller MUST either hand it to
// Cache::set or release it with free_value.
Value *alloc_value(std::size_t n);

// Frees a Value that was never added to the cache. Fatal if the value is
// shared.
void free_value(Value *v);

struct ValueStats {
  std::int64_t live{0};
  std::int64_t bytes{0};
};

// Process-wide count of Values that have been allocated and not yet freed.
ValueStats value_stats();

// Handle is a strong reference to a Value. It does not pin the value in the
// cache but keeps the buffer alive until released. Handles are move-only; an
// unreleased handle releases its reference on destruction.
class Handle {
public:
  Handle() = default;
  ~Handle() { release(); }

  Handle(const Handle &) = delete;
  Handle &operator=(const Handle &) = delete;
  Handle(Handle &&other) noexcept : value_(other.value_) {
    other.value_ = nullptr;
  }
  Handle &operator=(Handle &&other) noexcept;

  bool valid() const { return value_ != nullptr; }

  // Only callable on a valid handle.
  std::span<std::uint8_t> raw_buffer() const { return value_->buf(); }

  void release();

private:
  friend class Shard;

  // Adopts a reference the caller already owns.
  explicit Handle(Value *v) : value_(v) {}

  Value *value_{nullptr};
};

} // namespace block_cache
