#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "maybesync.hpp"
#include "test_harness.hpp"

using namespace maybesync;

// =============================================================================
// Sample Interface and Implementations
// =============================================================================

class handler {
public:
  virtual ~handler() = default;
  virtual int handle(int request) = 0;
};

class doubler : public handler {
public:
  int handle(int request) override { return request * 2; }
};

class offset : public handler {
  int delta_;

public:
  explicit offset(int delta) : delta_(delta) {}
  int handle(int request) override { return request + delta_; }
};

// Holds a pointer into its creator's stack.
class stack_writer : public handler {
  int *slot_;

public:
  static constexpr bool transferable = false;
  static constexpr bool shareable = false;

  explicit stack_writer(int *slot) : slot_(slot) {}
  int handle(int request) override { return *slot_ += request; }
};

// Movable to another thread, not safe to call concurrently.
class memo : public handler {
  int last_ = 0;

public:
  static constexpr bool shareable = false;
  int handle(int request) override { return std::exchange(last_, request); }
};

class destroy_counter : public handler {
  int *destroyed_;

public:
  explicit destroy_counter(int *destroyed) : destroyed_(destroyed) {}
  ~destroy_counter() override { ++*destroyed_; }
  int handle(int request) override { return request; }
};

MAYBESYNC_DECLARE_TRANSFERABLE(destroy_counter, true);

class unrelated {
public:
  virtual ~unrelated() = default;
};

using any_handler = MAYBESYNC_DYN(handler);
using send_handler = MAYBESYNC_DYN_TRANSFERABLE(handler);
using shared_handler = MAYBESYNC_DYN_SHAREABLE(handler);
using thread_safe_handler = MAYBESYNC_DYN_TRANSFERABLE_SHAREABLE(handler);

template <typename D, typename Impl>
inline constexpr bool holds = std::is_constructible_v<D, std::unique_ptr<Impl>>;

// =============================================================================
// Admission
// =============================================================================

// Unbounded handles accept every implementation in both modes.
static_assert(holds<any_handler, doubler>);
static_assert(holds<any_handler, stack_writer>);
static_assert(!holds<any_handler, unrelated>);

// Explicit markers always check the real guarantee.
static_assert(holds<dyn<handler, transferable_marker>, memo>);
static_assert(!holds<dyn<handler, transferable_marker>, stack_writer>);
static_assert(!holds<dyn<handler, shareable_marker>, memo>);
static_assert(holds<dyn<handler, transferable_marker, shareable_marker>,
                    offset>);

#if MAYBESYNC_SYNC
static_assert(std::is_same_v<send_handler, dyn<handler, transferable_marker>>);
static_assert(std::is_same_v<
              thread_safe_handler,
              dyn<handler, transferable_marker, shareable_marker>>);

static_assert(holds<send_handler, doubler>);
static_assert(!holds<send_handler, stack_writer>);
static_assert(holds<send_handler, memo>);
static_assert(!holds<shared_handler, memo>);
static_assert(!holds<thread_safe_handler, memo>);
static_assert(holds<thread_safe_handler, offset>);

static_assert(Transferable<send_handler> && !Shareable<send_handler>);
static_assert(ThreadSafe<thread_safe_handler>);
#else
// Single-thread builds attach no markers; every macro is the plain handle.
static_assert(std::is_same_v<send_handler, any_handler>);
static_assert(std::is_same_v<shared_handler, any_handler>);
static_assert(std::is_same_v<thread_safe_handler, any_handler>);

static_assert(holds<send_handler, stack_writer>);
static_assert(holds<thread_safe_handler, memo>);
#endif

// Widening drops markers; it never adds them.
static_assert(std::is_constructible_v<dyn<handler>,
                                      dyn<handler, transferable_marker> &&>);
static_assert(std::is_constructible_v<
              dyn<handler, shareable_marker>,
              dyn<handler, transferable_marker, shareable_marker> &&>);
static_assert(!std::is_constructible_v<dyn<handler, transferable_marker>,
                                       dyn<handler> &&>);
static_assert(!std::is_copy_constructible_v<any_handler>);

// =============================================================================
// Runtime Behaviour
// =============================================================================

void test_dispatch() {
  TEST("dispatch through each macro") {
    any_handler a = std::make_unique<doubler>();
    send_handler s = std::make_unique<offset>(5);
    shared_handler sh = std::make_unique<doubler>();
    thread_safe_handler ts = std::make_unique<offset>(-1);

    assert(a->handle(4) == 8);
    assert(s->handle(4) == 9);
    assert(sh->handle(3) == 6);
    assert((*ts).handle(3) == 2);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("make constructs in place") {
    auto h = send_handler::make<offset>(10);
    assert(h);
    assert(h->handle(1) == 11);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("empty handle") {
    any_handler empty;
    any_handler null = nullptr;
    assert(!empty);
    assert(!null);
    assert(empty.get() == nullptr);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("heterogeneous container") {
    std::vector<any_handler> chain;
    chain.emplace_back(std::make_unique<doubler>());
    chain.emplace_back(std::make_unique<offset>(3));
    chain.emplace_back(std::make_unique<doubler>());

    int value = 1;
    for (auto &h : chain)
      value = h->handle(value);
    assert(value == 10);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_ownership() {
  TEST("reset destroys the implementation") {
    int destroyed = 0;
    send_handler h = std::make_unique<destroy_counter>(&destroyed);
    assert(destroyed == 0);
    h.reset();
    assert(destroyed == 1);
    assert(!h);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("move transfers ownership") {
    int destroyed = 0;
    {
      any_handler a = std::make_unique<destroy_counter>(&destroyed);
      any_handler b = std::move(a);
      assert(!a);
      assert(b->handle(7) == 7);
    }
    assert(destroyed == 1);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("widening keeps the implementation") {
    dyn<handler, transferable_marker, shareable_marker> strict =
        std::make_unique<offset>(2);
    dyn<handler, transferable_marker> narrower = std::move(strict);
    dyn<handler> plain = std::move(narrower);
    assert(!strict);
    assert(!narrower);
    assert(plain->handle(1) == 3);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("into_unique releases the handle") {
    auto h = any_handler::make<doubler>();
    std::unique_ptr<handler> raw = std::move(h).into_unique();
    assert(!h);
    assert(raw->handle(21) == 42);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

void test_thread_bound_implementations() {
  TEST("unbounded handle holds thread-bound state") {
    int slot = 1;
    any_handler h = std::make_unique<stack_writer>(&slot);
    h->handle(4);
    assert(slot == 5);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

#if MAYBESYNC_SYNC
  TEST("transferable handle runs on a worker thread") {
    send_handler h = std::make_unique<memo>();
    h->handle(6);
    int seen = 0;
    std::thread worker([&seen, h = std::move(h)]() mutable {
      seen = h->handle(9);
    });
    worker.join();
    assert(seen == 6);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
#endif
}

int main() {
  print_banner("dyn");

  test_dispatch();
  test_ownership();
  test_thread_bound_implementations();

  return print_summary();
}
