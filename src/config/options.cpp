#include "block_cache/options.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace block_cache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
} // namespace

std::size_t shard_count_for(std::int64_t size, std::size_t cpus) {
  std::size_t m = 4 * std::max<std::size_t>(1, cpus);
  if (m > 4 && size / static_cast<std::int64_t>(m) < kMinimumShardSize)
    m = 4;
  return m;
}

bool load_options(const std::string &path, CacheOptions &opts,
                  std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "options file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheOptions o = opts;
  std::uint64_t u;
  bool b;
  try {
    if (extract_u64(text, "size", u))
      o.size = static_cast<std::int64_t>(std::clamp(
          u, static_cast<std::uint64_t>(1),
          static_cast<std::uint64_t>(1ULL << 50)));
    if (extract_u64(text, "shards", u))
      o.shards = static_cast<std::size_t>(std::clamp(
          u, static_cast<std::uint64_t>(0), static_cast<std::uint64_t>(4096)));
  } catch (const std::out_of_range &) {
    if (err)
      *err = "numeric value out of range";
    return false;
  }
  if (extract_bool(text, "verify_consistency", b))
    o.verify_consistency = b;

  opts = o;
  return true;
}

} // namespace block_cache
