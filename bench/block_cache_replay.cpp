#include "block_cache/cache.hpp"
#include "block_cache/options.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using namespace block_cache;

namespace {
// One line of the trace, e.g.
// {"op":"set","id":1,"file":3,"offset":8192,"size":4096}
struct TraceOp {
  std::string op;
  std::uint64_t id{1};
  std::uint64_t file{0};
  std::uint64_t offset{0};
  std::uint64_t size{4096};
};

bool extract_u64(const std::string &line, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(line, m, re))
    return false;
  out = std::stoull(m[1].str());
  return true;
}

bool extract_str(const std::string &line, const std::string &key,
                 std::string &out) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"([^\\\"]*)\\\"");
  std::smatch m;
  if (!std::regex_search(line, m, re))
    return false;
  out = m[1].str();
  return true;
}

bool load_trace(const std::string &path, std::vector<TraceOp> &ops,
                std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "trace file not found";
    return false;
  }
  std::size_t line_no = 0;
  for (std::string line; std::getline(in, line);) {
    ++line_no;
    if (line.empty())
      continue;
    TraceOp op;
    try {
      extract_u64(line, "id", op.id);
      extract_u64(line, "file", op.file);
      extract_u64(line, "offset", op.offset);
      extract_u64(line, "size", op.size);
    } catch (const std::out_of_range &) {
      if (err)
        *err = "numeric value out of range on line " + std::to_string(line_no);
      return false;
    }
    if (!extract_str(line, "op", op.op) ||
        (op.op != "get" && op.op != "set" && op.op != "del" &&
         op.op != "evict_file")) {
      if (err)
        *err = "unknown op on line " + std::to_string(line_no);
      return false;
    }
    ops.push_back(op);
  }
  return true;
}

std::string percentile(const std::vector<double> &v, double p) {
  if (v.empty())
    return "0";
  std::vector<double> s = v;
  std::sort(s.begin(), s.end());
  std::size_t idx = static_cast<std::size_t>(std::floor((s.size() - 1) * p));
  std::ostringstream os;
  os << s[idx];
  return os.str();
}
} // namespace

int main(int argc, char **argv) {
  std::string trace_path = "traces/replay.jsonl";
  std::string out_json = "replay_summary.json";
  CacheOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--trace" && i + 1 < argc)
      trace_path = argv[++i];
    else if (a == "--json" && i + 1 < argc)
      out_json = argv[++i];
    else if (a == "--size" && i + 1 < argc)
      opts.size = std::stoll(argv[++i]);
    else if (a == "--config" && i + 1 < argc) {
      std::string err;
      if (!load_options(argv[++i], opts, &err)) {
        std::cerr << "config error: " << err << "\n";
        return 1;
      }
    } else {
      std::cerr << "usage: block_cache_replay [--trace file] [--json file] "
                   "[--size bytes] [--config file]\n";
      return 1;
    }
  }

  std::vector<TraceOp> ops;
  std::string err;
  if (!load_trace(trace_path, ops, &err)) {
    std::cerr << trace_path << ": " << err << "\n";
    return 1;
  }

  Cache cache(opts);
  // Trace ids are arbitrary; each distinct one gets its own namespace.
  std::unordered_map<std::uint64_t, ID> ids;
  auto ns = [&](std::uint64_t trace_id) {
    auto it = ids.find(trace_id);
    if (it == ids.end())
      it = ids.emplace(trace_id, cache.new_id()).first;
    return it->second;
  };

  std::vector<double> lats;
  lats.reserve(ops.size());
  std::uint64_t gets = 0;
  std::uint64_t hits = 0;
  const auto replay_start = std::chrono::steady_clock::now();
  for (const auto &op : ops) {
    const ID id = ns(op.id);
    auto st = std::chrono::steady_clock::now();
    if (op.op == "get") {
      ++gets;
      if (cache.get(id, op.file, op.offset).valid())
        ++hits;
    } else if (op.op == "set") {
      cache.set(id, op.file, op.offset, alloc_value(op.size)).release();
    } else if (op.op == "del") {
      cache.del(id, op.file, op.offset);
    } else {
      cache.evict_file(id, op.file);
    }
    auto en = std::chrono::steady_clock::now();
    lats.push_back(std::chrono::duration<double, std::micro>(en - st).count());
  }

  const double seconds = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - replay_start)
                             .count();
  const double ops_s =
      seconds > 0 ? static_cast<double>(ops.size()) / seconds : 0.0;
  const double hit_rate =
      gets > 0 ? static_cast<double>(hits) / static_cast<double>(gets) : 0.0;
  const auto m = cache.metrics();

  std::ofstream jout(out_json);
  if (!jout.is_open()) {
    std::cerr << out_json << ": cannot open for writing\n";
    cache.unref();
    return 1;
  }
  jout << "{\n";
  jout << "  \"trace\": \"" << trace_path << "\",\n";
  jout << "  \"ops\": " << ops.size() << ",\n";
  jout << "  \"ops_per_sec\": " << ops_s << ",\n";
  jout << "  \"p50_us\": " << percentile(lats, 0.50) << ",\n";
  jout << "  \"p95_us\": " << percentile(lats, 0.95) << ",\n";
  jout << "  \"p99_us\": " << percentile(lats, 0.99) << ",\n";
  jout << "  \"p999_us\": " << percentile(lats, 0.999) << ",\n";
  jout << "  \"hit_rate\": " << hit_rate << ",\n";
  jout << "  \"size\": " << m.size << ",\n";
  jout << "  \"count\": " << m.count << "\n";
  jout << "}\n";

  std::cout << "ops/s=" << ops_s << " p50=" << percentile(lats, 0.50)
            << " p95=" << percentile(lats, 0.95)
            << " p99=" << percentile(lats, 0.99)
            << " p999=" << percentile(lats, 0.999) << " hit_rate=" << hit_rate
            << "\n";
  std::cout << cache.info();
  cache.unref();
  return 0;
}
