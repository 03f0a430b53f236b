#include "block_cache/cache.hpp"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <cstdio>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace block_cache;

namespace {
// Runs fn in a forked child and reports whether the child aborted.
template <typename Fn> bool aborts(Fn fn) {
  std::fflush(nullptr);
  pid_t pid = fork();
  if (pid == 0) {
    fn();
    _exit(0);
  }
  int status = 0;
  waitpid(pid, &status, 0);
  return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}
} // namespace

TEST_CASE("inserting a shared value is fatal", "[fatal]") {
  CHECK(aborts([] {
    Cache c(1 << 20);
    const ID id = c.new_id();
    Value *v = alloc_value(16);
    auto h = c.set(id, 1, 0, v);
    c.set(id, 1, 1, v);
  }));
}

TEST_CASE("freeing a cached value is fatal", "[fatal]") {
  CHECK(aborts([] {
    Cache c(1 << 20);
    Value *v = alloc_value(16);
    auto h = c.set(c.new_id(), 1, 0, v);
    free_value(v);
  }));
}

TEST_CASE("namespace zero is fatal", "[fatal]") {
  CHECK(aborts([] {
    Cache c(1 << 20);
    c.get(0, 1, 0);
  }));
  CHECK(aborts([] {
    Cache c(1 << 20);
    c.evict_file(0, 1);
  }));
}

TEST_CASE("releasing a reservation twice is fatal", "[fatal]") {
  CHECK(aborts([] {
    Cache c(1 << 20);
    auto release = c.reserve(1024);
    release();
    release();
  }));
}

TEST_CASE("cache reference count misuse is fatal", "[fatal]") {
  CHECK(aborts([] {
    Cache c(1 << 20);
    c.unref();
    c.unref();
  }));
  CHECK(aborts([] {
    Cache c(1 << 20);
    c.unref();
    c.ref();
  }));
}

TEST_CASE("well behaved children exit normally", "[fatal]") {
  CHECK_FALSE(aborts([] {
    Cache c(1 << 20);
    auto release = c.reserve(1024);
    release();
    c.set(c.new_id(), 1, 0, alloc_value(16)).release();
    c.unref();
  }));
}
