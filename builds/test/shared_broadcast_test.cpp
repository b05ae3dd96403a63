#include <atomic>
#include <cassert>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "eshare/eshare.hpp"

using namespace eshare;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

using int_broadcast = shared_broadcast<int>;

// Let everything queued on the loop run a few times over.
static task<void> settle(int rounds = 10) {
  for (int i = 0; i < rounds; ++i)
    co_await yield();
}

static std::vector<int> drain(subscription<int> &sub) {
  std::vector<int> values;
  while (auto value = sub.try_next())
    values.push_back(*value);
  return values;
}

// =============================================================================
// Coroutine Helpers
// =============================================================================

struct progress {
  std::atomic<int> emitted{0};
  std::atomic<bool> cancelled{false};
};

static task<void> produce(std::shared_ptr<int_broadcast> b, int count,
                          std::shared_ptr<progress> p) {
  try {
    for (int i = 0; i < count; ++i) {
      co_await b->emit(i);
      ++p->emitted;
    }
  } catch (const cancelled_exception &) {
    p->cancelled = true;
    throw;
  }
}

static task<void> consume(subscription<int> sub, int count,
                          std::shared_ptr<std::vector<int>> out) {
  for (int i = 0; i < count; ++i)
    out->push_back(co_await sub.next());
}

static task<std::vector<int>> round_trip(int replay, int extra, int count) {
  auto b = std::make_shared<int_broadcast>(replay, extra);
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};

  auto sub = b->subscribe();
  scope.launch(produce(b, count, std::make_shared<progress>()));

  std::vector<int> got;
  while (static_cast<int>(got.size()) < count)
    got.push_back(co_await sub.next());
  co_await scope.join();
  co_return got;
}

static std::vector<int> iota(int count) {
  std::vector<int> values;
  for (int i = 0; i < count; ++i)
    values.push_back(i);
  return values;
}

// =============================================================================
// Configuration Tests
// =============================================================================

void test_configuration() {
  TEST("negative replay is rejected") {
    bool threw = false;
    try {
      int_broadcast b(-1);
    } catch (const configuration_error &e) {
      threw = std::string(e.what()) == "replay cannot be negative, but was -1";
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("negative extra capacity is rejected") {
    bool threw = false;
    try {
      int_broadcast b(0, -2);
    } catch (const configuration_error &e) {
      threw = std::string(e.what()) ==
              "extraBufferCapacity cannot be negative, but was -2";
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("dropping policy needs some buffer") {
    bool threw = false;
    try {
      int_broadcast b(0, 0, overflow_policy::drop_oldest);
    } catch (const configuration_error &) {
      threw = true;
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("initial value needs replay") {
    bool threw = false;
    try {
      int_broadcast b(0, 4, overflow_policy::suspend, 1);
    } catch (const configuration_error &e) {
      threw = std::string(e.what()) ==
              "initialValue is supported only with replay > 0";
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("capacity is replay plus extra") {
    int_broadcast b(3, 5, overflow_policy::drop_latest);
    assert(b.replay() == 3);
    assert(b.capacity() == 8);
    assert(b.overflow() == overflow_policy::drop_latest);
    assert(to_string(b.overflow()) == "DROP_LATEST");

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Replay Tests
// =============================================================================

void test_replay() {
  TEST("late subscriber receives the replayed tail") {
    auto b = std::make_shared<int_broadcast>(2);
    assert(b->try_emit(1));
    assert(b->try_emit(2));
    assert(b->try_emit(3));

    auto sub = b->subscribe();
    assert((drain(sub) == std::vector<int>{2, 3}));
    assert((b->replay_cache() == std::vector<int>{2, 3}));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("initial value is replayed and restored by reset") {
    auto b = std::make_shared<int_broadcast>(1, 0, overflow_policy::suspend, 7);
    assert((b->replay_cache() == std::vector<int>{7}));

    assert(b->try_emit(8));
    assert((b->replay_cache() == std::vector<int>{8}));

    b->reset_buffer();
    assert((b->replay_cache() == std::vector<int>{7}));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("reset keeps values owed to a subscriber") {
    auto b = std::make_shared<int_broadcast>(2);
    auto sub = b->subscribe();
    assert(b->try_emit(1));
    assert(b->try_emit(2));

    b->reset_buffer();
    assert(b->replay_cache().empty());
    assert((drain(sub) == std::vector<int>{1, 2}));

    auto late = b->subscribe();
    assert(!late.try_next());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Overflow Tests
// =============================================================================

void test_overflow() {
  TEST("DROP_OLDEST keeps the newest values") {
    auto b = std::make_shared<int_broadcast>(0, 2, overflow_policy::drop_oldest);
    auto sub = b->subscribe();
    for (int i = 1; i <= 5; ++i)
      assert(b->try_emit(i));
    assert((drain(sub) == std::vector<int>{4, 5}));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("DROP_LATEST keeps the oldest values") {
    auto b = std::make_shared<int_broadcast>(0, 2, overflow_policy::drop_latest);
    auto sub = b->subscribe();
    for (int i = 1; i <= 5; ++i)
      assert(b->try_emit(i));
    assert((drain(sub) == std::vector<int>{1, 2}));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("SUSPEND try_emit fails while full") {
    auto b = std::make_shared<int_broadcast>(0, 1);
    auto sub = b->subscribe();
    assert(b->try_emit(1));
    assert(!b->try_emit(2));
    assert(sub.try_next() == 1);
    assert(b->try_emit(2));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("emit without subscribers never waits") {
    auto b = std::make_shared<int_broadcast>(0);
    block_on([](std::shared_ptr<int_broadcast> b) -> task<void> {
      for (int i = 0; i < 100; ++i)
        co_await b->emit(i);
    }(b));
    assert(b->replay_cache().empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Suspension Tests
// =============================================================================

static task<void> pacing_scenario() {
  auto b = std::make_shared<int_broadcast>(0, 2);
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};
  auto p = std::make_shared<progress>();

  auto sub = b->subscribe();
  scope.launch(produce(b, 10, p));
  co_await settle();
  // Two values fit; the third emit waits for the subscriber.
  assert(p->emitted == 2);

  assert(sub.try_next() == 0);
  co_await settle();
  assert(p->emitted == 3);

  std::vector<int> rest;
  for (int i = 1; i < 10; ++i)
    rest.push_back(co_await sub.next());
  assert((rest == std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8, 9}));
  co_await scope.join();
  assert(p->emitted == 10);
}

static task<void> withdraw_scenario() {
  auto b = std::make_shared<int_broadcast>(0, 1);
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};
  auto p = std::make_shared<progress>();

  auto sub = b->subscribe();
  auto producer = scope.launch(produce(b, 2, p));
  co_await settle();
  assert(p->emitted == 1);

  producer.cancel();
  co_await producer.join();
  assert(p->cancelled);
  assert(producer.is_completed());
  assert(!producer.failure());

  assert((drain(sub) == std::vector<int>{0}));
  co_await scope.join();
}

static task<void> unsubscribe_scenario() {
  auto b = std::make_shared<int_broadcast>(0, 1);
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};
  auto p = std::make_shared<progress>();

  auto sub = b->subscribe();
  scope.launch(produce(b, 5, p));
  co_await settle();
  assert(p->emitted == 1);

  // Without subscribers nothing holds the emitter back.
  sub.unsubscribe();
  co_await scope.join();
  assert(p->emitted == 5);
}

void test_suspension() {
  TEST("round trip through a small buffer keeps order") {
    auto got = block_on(round_trip(0, 4, 200));
    assert(got == iota(200));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("round trip through a rendezvous broadcast") {
    auto got = block_on(round_trip(0, 0, 50));
    assert(got == iota(50));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("SUSPEND paces the emitter to the slowest subscriber") {
    block_on(pacing_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("cancelled emitter withdraws its value") {
    block_on(withdraw_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("last unsubscribe releases a suspended emitter") {
    block_on(unsubscribe_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Receiving Tests
// =============================================================================

static task<void> timeout_scenario() {
  auto b = std::make_shared<int_broadcast>(0, 4);
  auto sub = b->subscribe();

  auto start = clock_type::now();
  auto none = co_await sub.next_for(20ms);
  assert(!none);
  assert(clock_type::now() - start >= 20ms);

  assert(b->try_emit(5));
  auto five = co_await sub.next_for(1s);
  assert(five == 5);
}

static task<void> close_scenario() {
  auto b = std::make_shared<int_broadcast>(0, 4);
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};
  auto released = std::make_shared<bool>(false);

  auto consumer = [](subscription<int> sub,
                     std::shared_ptr<bool> released) -> task<void> {
    try {
      co_await sub.next();
    } catch (const cancelled_exception &) {
      *released = true;
    }
  };
  scope.launch(consumer(b->subscribe(), released));
  co_await settle();
  assert(!*released);

  b->close();
  co_await scope.join();
  assert(*released);
  assert(b->is_closed());
}

static task<void> cancel_receiver_scenario() {
  auto b = std::make_shared<int_broadcast>(0, 4);
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};
  auto out = std::make_shared<std::vector<int>>();

  auto consumer = scope.launch(consume(b->subscribe(), 10, out));
  co_await settle();
  assert(b->subscription_count().value() == 1);

  scope.cancel();
  co_await scope.join();
  assert(out->empty());
  assert(consumer.is_completed());
  assert(b->subscription_count().value() == 0);
}

void test_receiving() {
  TEST("next_for gives up at the deadline") {
    block_on(timeout_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("close releases waiting subscribers") {
    block_on(close_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("cancelling a receiver drops its subscription") {
    block_on(cancel_receiver_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("moved-from subscription is inactive") {
    auto b = std::make_shared<int_broadcast>(1);
    auto a = b->subscribe();
    auto c = std::move(a);
    assert(!a.is_active());
    assert(c.is_active());
    assert(!a.try_next());

    bool threw = false;
    try {
      block_on(a.next());
    } catch (const cancelled_exception &) {
      threw = true;
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Subscription Count Tests
// =============================================================================

// Resumes every handle on the spot, inside whatever call woke it.
class inline_executor final : public executor {
public:
  void schedule(std::coroutine_handle<> handle) override { handle.resume(); }
};

static task<void> watch_count(std::shared_ptr<int_broadcast> b,
                              std::shared_ptr<std::vector<std::size_t>> seen) {
  auto sub = b->subscription_count().subscribe();
  while (true) {
    std::size_t n = co_await sub.next();
    // replay_cache() takes the counted broadcast's own lock.
    seen->push_back(n + b->replay_cache().size());
    if (n == 1)
      co_return;
  }
}

void test_subscription_count() {
  TEST("count follows subscribe and unsubscribe") {
    auto b = std::make_shared<int_broadcast>(0);
    auto count = b->subscription_count();
    assert(count.value() == 0);

    auto first = b->subscribe();
    assert(count.value() == 1);
    {
      auto second = b->subscribe();
      assert(count.value() == 2);
    }
    assert(count.value() == 1);

    first.unsubscribe();
    assert(count.value() == 0);
    first.unsubscribe();
    assert(count.value() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("count watcher woken inline may use the broadcast") {
    inline_executor exec;
    auto b = std::make_shared<int_broadcast>(0);
    auto seen = std::make_shared<std::vector<std::size_t>>();

    auto watcher = launch(nullptr, exec, watch_count(b, seen));
    assert((*seen == std::vector<std::size_t>{0}));

    auto sub = b->subscribe();
    assert((*seen == std::vector<std::size_t>{0, 1}));
    assert(watcher.is_completed());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("count created after subscribing starts at the live count") {
    auto b = std::make_shared<int_broadcast>(0);
    auto sub = b->subscribe();
    assert(b->subscription_count().value() == 1);
    assert(b->subscription_count() == b->subscription_count());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Multi-threaded Tests
// =============================================================================

static task<void> fan_out(int subscribers, int count) {
  auto b = std::make_shared<int_broadcast>(0, 16);
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};

  std::vector<std::shared_ptr<std::vector<int>>> outputs;
  for (int i = 0; i < subscribers; ++i) {
    outputs.push_back(std::make_shared<std::vector<int>>());
    scope.launch(consume(b->subscribe(), count, outputs.back()));
  }
  scope.launch(produce(b, count, std::make_shared<progress>()));
  co_await scope.join();

  for (const auto &out : outputs)
    assert(*out == iota(count));
}

void test_multithreaded() {
  TEST("every subscriber sees every value across threads") {
    thread_pool pool(4);
    block_on(fan_out(3, 1000), pool);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("concurrent try_emit with a DROP_OLDEST buffer") {
    thread_pool pool(4);
    auto b = std::make_shared<int_broadcast>(4, 0, overflow_policy::drop_oldest);
    auto finished = std::make_shared<std::atomic<int>>(0);

    block_on(
        [](std::shared_ptr<int_broadcast> b,
           std::shared_ptr<std::atomic<int>> done) -> task<void> {
          auto self = co_await current_job();
          task_scope scope{self->get_executor()};
          for (int t = 0; t < 4; ++t) {
            scope.launch([](std::shared_ptr<int_broadcast> b, int base,
                            std::shared_ptr<std::atomic<int>> done)
                             -> task<void> {
              for (int i = 0; i < 250; ++i)
                co_await b->emit(base + i);
              ++*done;
            }(b, t * 1000, done));
          }
          co_await scope.join();
        }(b, finished),
        pool);

    assert(*finished == 4);
    assert(b->replay_cache().size() == 4);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Shared Broadcast Tests ===" << std::endl << std::endl;

  std::cout << "--- Configuration Tests ---" << std::endl;
  test_configuration();
  std::cout << std::endl;

  std::cout << "--- Replay Tests ---" << std::endl;
  test_replay();
  std::cout << std::endl;

  std::cout << "--- Overflow Tests ---" << std::endl;
  test_overflow();
  std::cout << std::endl;

  std::cout << "--- Suspension Tests ---" << std::endl;
  test_suspension();
  std::cout << std::endl;

  std::cout << "--- Receiving Tests ---" << std::endl;
  test_receiving();
  std::cout << std::endl;

  std::cout << "--- Subscription Count Tests ---" << std::endl;
  test_subscription_count();
  std::cout << std::endl;

  std::cout << "--- Multi-threaded Tests ---" << std::endl;
  test_multithreaded();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
