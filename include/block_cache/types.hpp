#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace block_cache {

// ID is a namespace for file numbers. It lets one Cache be shared by several
// storage engine instances without key collisions. Zero is never valid.
using ID = std::uint64_t;
using FileNum = std::uint64_t;

enum class EntryType : std::uint8_t { Hot, Cold, Test };

struct Key {
  ID id{0};
  FileNum file_num{0};
  std::uint64_t offset{0};

  // The key used to group all blocks of one file.
  Key file() const { return Key{id, file_num, 0}; }

  bool operator==(const Key &other) const {
    return id == other.id && file_num == other.file_num &&
           offset == other.offset;
  }
};

struct KeyHash {
  std::size_t operator()(const Key &k) const;
};

// 64-bit FNV hash over the little-endian bytes of id, file and offset. Used
// both for shard routing and for the shard maps.
std::uint64_t hash_key(ID id, FileNum file_num, std::uint64_t offset);

std::string key_string(const Key &k);
const char *entry_type_name(EntryType t);

[[noreturn]] void fatal(const std::string &msg);

} // namespace block_cache
