#include "gitdock/cache.hpp"
#include "gitdock/error.hpp"
#include "gitdock/hash.hpp"
#include "support.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <thread>
#include <vector>

using namespace gitdock;
using namespace std::chrono_literals;
using test::expect;

namespace {

CacheKey key(const std::string &repo, std::string_view object,
             ViewKind kind = ViewKind::TreeListing) {
  return CacheKey{repo, sha1(object), kind};
}

// Spin until `cond` holds or a generous deadline passes.
template <typename Pred> void wait_for(Pred cond, const std::string &what) {
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (!cond()) {
    expect(std::chrono::steady_clock::now() < deadline, "timed out waiting for " + what);
    std::this_thread::sleep_for(1ms);
  }
}

void single_flight() {
  ViewCache cache(1 << 20);
  std::atomic<int> computed{0};
  std::vector<std::thread> threads;
  std::vector<CachedBytes> results(8);
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] {
      results[i] = cache.get_or_compute(key("r", "tree"), [&] {
        ++computed;
        std::this_thread::sleep_for(100ms);
        return std::string("listing");
      });
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  expect(computed == 1, "computed once, got " + std::to_string(computed.load()));
  for (const auto &r : results) {
    expect(r && *r == "listing" && r == results[0], "all callers share one value");
  }
  expect(cache.stats().misses == 1 && cache.stats().hits == 7, "one miss, seven hits");
}

void failures_are_not_cached() {
  ViewCache cache(1 << 20);
  std::atomic<bool> started{false};
  std::promise<void> release;
  auto gate = release.get_future().share();

  std::thread owner([&] {
    try {
      (void)cache.get_or_compute(key("r", "c"), [&]() -> std::string {
        started = true;
        gate.wait();
        throw Error(Errc::ObjectMissing, "object gone");
      });
    } catch (const Error &) {
    }
  });
  wait_for([&] { return started.load(); }, "computation start");

  std::atomic<bool> waiter_ran_compute{false};
  std::promise<Errc> waiter_code;
  std::thread waiter([&] {
    try {
      (void)cache.get_or_compute(key("r", "c"), [&] {
        waiter_ran_compute = true;
        return std::string("unexpected");
      });
      waiter_code.set_value(Errc::Protocol);
    } catch (const Error &e) {
      waiter_code.set_value(e.code());
    }
  });
  // The waiter counts as a hit once it has joined the pending computation.
  wait_for([&] { return cache.stats().hits == 1; }, "waiter to join");
  release.set_value();
  owner.join();
  waiter.join();

  expect(!waiter_ran_compute, "waiter did not compute");
  expect(waiter_code.get_future().get() == Errc::ObjectMissing, "waiter sees the failure");
  expect(!cache.contains(key("r", "c")), "failure not cached");
  const auto retry = cache.get_or_compute(key("r", "c"), [] { return std::string("ok"); });
  expect(*retry == "ok", "next caller computes again");
}

void invalidation() {
  ViewCache cache(1 << 20);
  int computed = 0;
  auto compute = [&] {
    ++computed;
    return "v" + std::to_string(computed);
  };
  expect(*cache.get_or_compute(key("a", "x"), compute) == "v1", "first compute");
  expect(*cache.get_or_compute(key("a", "x"), compute) == "v1", "cached");
  expect(*cache.get_or_compute(key("a", "x", ViewKind::CommitLog), compute) == "v2",
         "kind is part of the key");
  (void)cache.get_or_compute(key("b", "x"), compute);

  cache.invalidate("a");
  expect(!cache.contains(key("a", "x")) && !cache.contains(key("a", "x", ViewKind::CommitLog)),
         "repository entries dropped");
  expect(cache.contains(key("b", "x")), "other repository untouched");
  expect(*cache.get_or_compute(key("a", "x"), compute) == "v4", "recomputed after invalidate");
}

void invalidate_during_compute() {
  ViewCache cache(1 << 20);
  std::atomic<bool> started{false};
  std::promise<void> release;
  auto gate = release.get_future().share();
  std::promise<std::string> seen;

  std::thread t([&] {
    const auto v = cache.get_or_compute(key("r", "d", ViewKind::CommitDiff), [&] {
      started = true;
      gate.wait();
      return std::string("stale diff");
    });
    seen.set_value(*v);
  });
  wait_for([&] { return started.load(); }, "computation start");
  cache.invalidate("r");
  release.set_value();
  t.join();

  expect(seen.get_future().get() == "stale diff", "caller still gets its value");
  expect(!cache.contains(key("r", "d", ViewKind::CommitDiff)),
         "value computed before invalidate is not stored");
  expect(cache.entry_count() == 0 && cache.size_bytes() == 0, "cache empty");
}

void lru_budget() {
  ViewCache cache(10);
  auto value = [](std::string v) { return [v] { return v; }; };
  (void)cache.get_or_compute(key("r", "1"), value("aaaa"));
  (void)cache.get_or_compute(key("r", "2"), value("bbbb"));
  (void)cache.get_or_compute(key("r", "1"), value("unused")); // touch 1
  (void)cache.get_or_compute(key("r", "3"), value("cccc"));

  expect(cache.contains(key("r", "1")) && cache.contains(key("r", "3")), "recent entries kept");
  expect(!cache.contains(key("r", "2")), "least recently used evicted");
  expect(cache.size_bytes() == 8 && cache.stats().evictions == 1, "budget respected");

  const auto big = cache.get_or_compute(key("r", "big"), value(std::string(11, 'z')));
  expect(big->size() == 11, "oversized value returned");
  expect(!cache.contains(key("r", "big")) && cache.entry_count() == 2,
         "oversized value not stored");
}

} // namespace

int main() {
  try {
    single_flight();
    failures_are_not_cached();
    invalidation();
    invalidate_during_compute();
    lru_budget();
  } catch (const std::exception &e) {
    std::cerr << "cache: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
