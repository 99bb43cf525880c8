#include "test_framework.hpp"

#include "webfetch/cache/response_cache.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace {

/// Steady clock that only moves when the test advances it.
struct ManualClock {
  std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
  std::shared_ptr<std::atomic<std::int64_t>> offset_ms =
      std::make_shared<std::atomic<std::int64_t>>(0);

  [[nodiscard]] webfetch::cache::ResponseCache::Clock fn() const {
    return [origin = origin, offset = offset_ms]() {
      return origin + std::chrono::milliseconds(offset->load());
    };
  }

  void advance(std::chrono::milliseconds by) const { offset_ms->fetch_add(by.count()); }
};

} // namespace

void register_cache_tests(std::vector<webfetch::tests::TestCase> &tests) {
  using webfetch::tests::require;
  namespace cache = webfetch::cache;
  using std::chrono::milliseconds;
  using std::chrono::minutes;

  tests.push_back({"cache_set_then_get", [] {
                     ManualClock clock;
                     cache::ResponseCache store(minutes(15), minutes(5), clock.fn());
                     store.set("https://example.com/", "hello");
                     const auto hit = store.get("https://example.com/");
                     require(hit.has_value() && *hit == "hello", "expected cache hit");
                     require(!store.get("https://example.com/other").has_value(),
                             "unknown key should miss");
                   }});

  tests.push_back({"cache_set_replaces_and_refreshes", [] {
                     ManualClock clock;
                     cache::ResponseCache store(minutes(15), minutes(5), clock.fn());
                     store.set("k", "old");
                     clock.advance(minutes(10));
                     store.set("k", "new");
                     clock.advance(minutes(10));
                     const auto hit = store.get("k");
                     require(hit.has_value() && *hit == "new",
                             "second set should replace value and timestamp");
                     require(store.size() == 1, "one entry expected");
                   }});

  tests.push_back({"cache_get_after_ttl_misses_and_removes", [] {
                     ManualClock clock;
                     cache::ResponseCache store(minutes(15), minutes(5), clock.fn());
                     store.set("k", "v");
                     clock.advance(minutes(15));
                     require(store.get("k").has_value(), "entry is still valid at exactly the ttl");
                     clock.advance(milliseconds(1));
                     require(!store.get("k").has_value(), "entry should expire after the ttl");
                     require(store.size() == 0, "expired entry should be removed on get");
                   }});

  tests.push_back({"cache_sweep_removes_only_expired", [] {
                     ManualClock clock;
                     cache::ResponseCache store(minutes(15), minutes(5), clock.fn());
                     store.set("old", "1");
                     clock.advance(minutes(10));
                     store.set("fresh", "2");
                     clock.advance(minutes(6));
                     require(store.sweep() == 1, "one expired entry expected");
                     require(store.size() == 1, "fresh entry should remain");
                     require(store.get("fresh").has_value(), "fresh entry readable");
                   }});

  tests.push_back({"cache_background_sweep_and_stop", [] {
                     ManualClock clock;
                     cache::ResponseCache store(milliseconds(100), milliseconds(20), clock.fn());
                     store.start();
                     store.start();
                     require(store.running(), "sweeper should run");
                     store.set("a", "1");
                     store.set("b", "2");
                     clock.advance(milliseconds(500));
                     bool swept = false;
                     for (int i = 0; i < 100 && !swept; ++i) {
                       std::this_thread::sleep_for(milliseconds(10));
                       swept = store.size() == 0;
                     }
                     require(swept, "background sweep should drop expired entries");

                     store.set("c", "3");
                     store.stop();
                     require(!store.running(), "sweeper should stop");
                     require(store.size() == 0, "stop should clear the cache");
                     store.stop();
                   }});
}
