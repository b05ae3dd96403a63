#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
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

using commands = std::vector<sharing_command>;
using counter = latest_value_broadcast<std::size_t>;

static task<void> settle(int rounds = 10) {
  for (int i = 0; i < rounds; ++i)
    co_await yield();
}

// Collects the commands of policy for count into out until cancelled.
static job watch(task_scope &scope, const start_policy &policy,
                 std::shared_ptr<counter> count,
                 std::shared_ptr<commands> out) {
  return scope.launch(
      policy.command_flow(readonly_latest_value<std::size_t>{count})
          .collect([out](sharing_command command) { out->push_back(command); }));
}

constexpr auto START = sharing_command::start;
constexpr auto STOP = sharing_command::stop;
constexpr auto RESET = sharing_command::stop_and_reset_buffer;

// =============================================================================
// Description Tests
// =============================================================================

void test_description() {
  TEST("to_string names the policy") {
    assert(start_policy::eagerly().to_string() == "SharingStarted.Eagerly");
    assert(start_policy::lazily().to_string() == "SharingStarted.Lazily");
    assert(start_policy::while_subscribed().to_string() ==
           "SharingStarted.WhileSubscribed()");

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("to_string lists only non-default parameters") {
    assert(start_policy::while_subscribed(5000ms).to_string() ==
           "SharingStarted.WhileSubscribed(stopTimeout=5000ms)");
    assert(start_policy::while_subscribed(0ms, 0ms).to_string() ==
           "SharingStarted.WhileSubscribed(replayExpiration=0ms)");
    assert(start_policy::while_subscribed(1000ms, 2000ms).to_string() ==
           "SharingStarted.WhileSubscribed(stopTimeout=1000ms, "
           "replayExpiration=2000ms)");

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("equality compares mode and parameters") {
    assert(start_policy::eagerly() == start_policy::eagerly());
    assert(!(start_policy::eagerly() == start_policy::lazily()));
    assert(start_policy::while_subscribed(1s) ==
           start_policy::while_subscribed(1000ms));
    assert(!(start_policy::while_subscribed(1s) ==
             start_policy::while_subscribed(1s, 1s)));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("command names") {
    assert(to_string(START) == "START");
    assert(to_string(STOP) == "STOP");
    assert(to_string(RESET) == "STOP_AND_RESET_BUFFER");

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("negative timeouts are rejected") {
    bool stop_threw = false;
    try {
      start_policy::while_subscribed(-1ms);
    } catch (const configuration_error &e) {
      stop_threw = std::string(e.what()) == "stopTimeout cannot be negative";
    }
    assert(stop_threw);

    bool expiration_threw = false;
    try {
      start_policy::while_subscribed(0ms, -1ms);
    } catch (const configuration_error &e) {
      expiration_threw =
          std::string(e.what()) == "replayExpiration cannot be negative";
    }
    assert(expiration_threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Eager and Lazy Tests
// =============================================================================

static task<void> eager_scenario() {
  auto count = std::make_shared<counter>(0);
  auto out = std::make_shared<commands>();
  co_await start_policy::eagerly()
      .command_flow(readonly_latest_value<std::size_t>{count})
      .collect([out](sharing_command command) { out->push_back(command); });
  assert((*out == commands{START}));
}

static task<void> lazy_scenario() {
  auto count = std::make_shared<counter>(0);
  auto out = std::make_shared<commands>();
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};

  watch(scope, start_policy::lazily(), count, out);
  co_await settle();
  assert(out->empty());

  count->set_value(1);
  co_await settle();
  assert((*out == commands{START}));

  count->set_value(0);
  co_await settle();
  count->set_value(2);
  co_await settle();
  assert((*out == commands{START}));

  scope.cancel();
  co_await scope.join();
}

void test_eager_lazy() {
  TEST("eager starts once and completes") {
    block_on(eager_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("lazy starts with the first subscriber and never stops") {
    block_on(lazy_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// While-subscribed Tests
// =============================================================================

static task<void> immediate_scenario() {
  auto count = std::make_shared<counter>(0);
  auto out = std::make_shared<commands>();
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};

  watch(scope, start_policy::while_subscribed(0ms, 0ms), count, out);
  co_await settle();
  // No leading stop before anything started.
  assert(out->empty());

  count->set_value(1);
  co_await settle();
  assert((*out == commands{START}));

  count->set_value(3);
  co_await settle();
  assert((*out == commands{START}));

  count->set_value(0);
  co_await settle();
  assert((*out == commands{START, RESET}));

  count->set_value(1);
  co_await settle();
  assert((*out == commands{START, RESET, START}));

  scope.cancel();
  co_await scope.join();
}

static task<void> timed_scenario() {
  auto count = std::make_shared<counter>(0);
  auto out = std::make_shared<commands>();
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};

  watch(scope, start_policy::while_subscribed(50ms, 200ms), count, out);
  count->set_value(1);
  co_await settle();
  assert((*out == commands{START}));

  // Back within the stop timeout: nothing happens.
  count->set_value(0);
  co_await sleep_for(10ms);
  count->set_value(1);
  co_await sleep_for(80ms);
  assert((*out == commands{START}));

  count->set_value(0);
  co_await sleep_for(120ms);
  assert((*out == commands{START, STOP}));

  co_await sleep_for(280ms);
  assert((*out == commands{START, STOP, RESET}));

  scope.cancel();
  co_await scope.join();
}

static task<void> resubscribe_before_expiration_scenario() {
  auto count = std::make_shared<counter>(0);
  auto out = std::make_shared<commands>();
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};

  watch(scope, start_policy::while_subscribed(0ms, 200ms), count, out);
  count->set_value(1);
  co_await settle();
  count->set_value(0);
  co_await sleep_for(20ms);
  assert((*out == commands{START, STOP}));

  count->set_value(1);
  co_await settle();
  assert((*out == commands{START, STOP, START}));

  scope.cancel();
  co_await scope.join();
}

static task<void> never_expire_scenario() {
  auto count = std::make_shared<counter>(0);
  auto out = std::make_shared<commands>();
  auto self = co_await current_job();
  task_scope scope{self->get_executor()};

  watch(scope, start_policy::while_subscribed(), count, out);
  count->set_value(1);
  co_await settle();
  count->set_value(0);
  co_await sleep_for(50ms);
  assert((*out == commands{START, STOP}));

  scope.cancel();
  co_await scope.join();
}

void test_while_subscribed() {
  TEST("zero timeouts stop and reset right away") {
    block_on(immediate_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("stop timeout and replay expiration are honoured") {
    block_on(timed_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("subscriber returning before expiration restarts") {
    block_on(resubscribe_before_expiration_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("default replay expiration never resets") {
    block_on(never_expire_scenario());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Start Policy Tests ===" << std::endl << std::endl;

  std::cout << "--- Description Tests ---" << std::endl;
  test_description();
  std::cout << std::endl;

  std::cout << "--- Eager and Lazy Tests ---" << std::endl;
  test_eager_lazy();
  std::cout << std::endl;

  std::cout << "--- While-subscribed Tests ---" << std::endl;
  test_while_subscribed();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
