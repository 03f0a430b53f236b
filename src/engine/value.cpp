#include "block_cache/value.hpp"
#include "block_cache/types.hpp"

#include <new>
#include <string>

namespace block_cache {
namespace {
std::atomic<std::int64_t> live_values{0};
std::atomic<std::int64_t> live_bytes{0};
} // namespace

void Value::acquire() {
  const auto v = refs_.fetch_add(1, std::memory_order_acq_rel) + 1;
  if (v <= 1)
    fatal("inconsistent value reference count: " + std::to_string(v));
}

void Value::release() {
  const auto v = refs_.fetch_sub(1, std::memory_order_acq_rel) - 1;
  if (v < 0)
    fatal("value released too many times: refs=" + std::to_string(v));
  if (v > 0)
    return;
  live_values.fetch_sub(1, std::memory_order_relaxed);
  live_bytes.fetch_sub(static_cast<std::int64_t>(size_),
                       std::memory_order_relaxed);
  this->~Value();
  ::operator delete(static_cast<void *>(this));
}

Value *alloc_value(std::size_t n) {
  void *mem = ::operator new(sizeof(Value) + n);
  live_values.fetch_add(1, std::memory_order_relaxed);
  live_bytes.fetch_add(static_cast<std::int64_t>(n), std::memory_order_relaxed);
  return new (mem) Value(n);
}

void free_value(Value *v) {
  if (const auto n = v->refs(); n != 1)
    fatal("value has been added to the cache: refs=" + std::to_string(n));
  v->release();
}

ValueStats value_stats() {
  return {live_values.load(std::memory_order_relaxed),
          live_bytes.load(std::memory_order_relaxed)};
}

Handle &Handle::operator=(Handle &&other) noexcept {
  if (this != &other) {
    release();
    value_ = other.value_;
    other.value_ = nullptr;
  }
  return *this;
}

void Handle::release() {
  if (value_ == nullptr)
    return;
  Value *v = value_;
  value_ = nullptr;
  v->release();
}

} // namespace block_cache
