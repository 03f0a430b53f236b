#include "block_cache/types.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace block_cache {

std::uint64_t hash_key(ID id, FileNum file_num, std::uint64_t offset) {
  constexpr std::uint64_t kOffset64 = 14695981039346656037ULL;
  constexpr std::uint64_t kPrime64 = 1099511628211ULL;

  std::uint64_t h = kOffset64;
  auto mix = [&h](std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
      h *= kPrime64;
      h ^= v & 0xff;
      v >>= 8;
    }
  };
  mix(id);
  mix(file_num);
  mix(offset);
  return h;
}

std::size_t KeyHash::operator()(const Key &k) const {
  // The shard index already consumed the low bits of hash_key, so spread them
  // again before the map takes its own modulus.
  std::uint64_t h = hash_key(k.id, k.file_num, k.offset);
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  return static_cast<std::size_t>(h);
}

std::string key_string(const Key &k) {
  std::ostringstream os;
  os << k.id << "/" << k.file_num << "/" << k.offset;
  return os.str();
}

const char *entry_type_name(EntryType t) {
  switch (t) {
  case EntryType::Hot:
    return "hot";
  case EntryType::Cold:
    return "cold";
  case EntryType::Test:
    return "test";
  }
  return "unknown";
}

void fatal(const std::string &msg) {
  std::cerr << "block_cache: " << msg << std::endl;
  std::abort();
}

} // namespace block_cache
