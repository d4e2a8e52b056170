#include "../include/mwclient/context.hpp"
#include "../include/mwclient/rate_limiter.hpp"
#include "../include/mwclient/sync.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using clock_type = mwclient::context::clock;

int main() {
  int passed = 0;

  // --- context ---
  {
    auto ctx = mwclient::context::background();
    assert(!ctx.done());
    ++passed;
    assert(!ctx.has_deadline());
    ++passed;
  }
  {
    auto parent = mwclient::context::background().with_cancel();
    auto child = parent.with_timeout(1h);
    parent.cancel();
    assert(child.cancelled());
    ++passed;
    bool threw = false;
    try {
      child.check();
    } catch (const mwclient::cancelled_error &e) {
      threw = !e.deadline_exceeded();
    }
    assert(threw);
    ++passed;
  }
  {
    auto parent = mwclient::context::background().with_cancel();
    auto child = parent.with_cancel();
    child.cancel();
    assert(!parent.cancelled());
    ++passed;
  }
  {
    auto ctx = mwclient::context::background().with_timeout(30ms);
    auto start = clock_type::now();
    bool threw = false;
    try {
      ctx.sleep_for(10s);
    } catch (const mwclient::cancelled_error &e) {
      threw = e.deadline_exceeded();
    }
    assert(threw);
    ++passed;
    assert(clock_type::now() - start < 5s);
    ++passed;
  }
  {
    auto ctx = mwclient::context::background().with_cancel();
    std::thread canceller([ctx]() {
      std::this_thread::sleep_for(20ms);
      ctx.cancel();
    });
    bool threw = false;
    try {
      ctx.sleep_for(10s);
    } catch (const mwclient::cancelled_error &) {
      threw = true;
    }
    canceller.join();
    assert(threw);
    ++passed;
  }

  // --- mailbox ---
  {
    mwclient::mailbox<int> box(2);
    assert(box.try_push(1));
    assert(box.try_push(2));
    assert(!box.try_push(3));
    ++passed;
    auto first = box.pop_until(clock_type::now());
    assert(first && *first == 1);
    ++passed;
    box.close();
    assert(!box.push(4));
    ++passed;
    auto second = box.pop_until(clock_type::now() + 1s);
    assert(second && *second == 2);
    ++passed;
    assert(!box.pop_until(clock_type::now() + 1s));
    ++passed;
  }
  {
    mwclient::mailbox<int> box(1);
    auto start = clock_type::now();
    assert(!box.pop(mwclient::context::background(), clock_type::now() + 20ms));
    assert(clock_type::now() - start >= 20ms);
    ++passed;
  }
  {
    // a full mailbox blocks the producer until a consumer makes room
    mwclient::mailbox<int> box(1);
    assert(box.try_push(1));
    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
      box.push(2);
      pushed = true;
    });
    std::this_thread::sleep_for(30ms);
    assert(!pushed);
    auto v = box.pop_until(clock_type::now() + 1s);
    producer.join();
    assert(v && *v == 1 && pushed);
    ++passed;
  }

  // --- session_semaphore ---
  {
    mwclient::session_semaphore sem(2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
      workers.emplace_back([&]() {
        mwclient::session_permit permit(sem, mwclient::context::background());
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(10ms);
        --active;
      });
    }
    for (auto &w : workers)
      w.join();
    assert(peak.load() <= 2);
    ++passed;
    assert(sem.available() == 2);
    ++passed;
  }
  {
    mwclient::session_semaphore sem(1);
    mwclient::session_permit held(sem, mwclient::context::background());
    bool threw = false;
    try {
      mwclient::session_permit blocked(sem,
                                       mwclient::context::background().with_timeout(20ms));
    } catch (const mwclient::cancelled_error &) {
      threw = true;
    }
    assert(threw);
    ++passed;
  }

  // --- token_bucket ---
  {
    mwclient::token_bucket bucket(600); // one token per 100ms
    auto ctx = mwclient::context::background();
    auto start = clock_type::now();
    bucket.wait(ctx);
    bucket.wait(ctx);
    bucket.wait(ctx);
    auto elapsed = clock_type::now() - start;
    assert(elapsed >= 190ms);
    ++passed;
    assert(bucket.interval() == std::chrono::milliseconds(100));
    ++passed;
  }
  {
    mwclient::token_bucket bucket(0);
    assert(bucket.calls_per_minute() == 300);
    ++passed;
  }
  {
    mwclient::token_bucket bucket(1);
    assert(bucket.try_acquire());
    assert(!bucket.try_acquire());
    ++passed;
    bool threw = false;
    try {
      bucket.wait(mwclient::context::background().with_timeout(20ms));
    } catch (const mwclient::cancelled_error &) {
      threw = true;
    }
    assert(threw);
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
