#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <thread>
#include <vector>

#include "maybesync.hpp"
#include "test_harness.hpp"

using namespace maybesync;

// =============================================================================
// Layout
// =============================================================================

template <typename Alias, typename T>
inline constexpr bool matches_std_atomic =
    sizeof(Alias) == sizeof(std::atomic<T>) &&
    alignof(Alias) == alignof(std::atomic<T>);

static_assert(matches_std_atomic<atomic_bool, bool>);
static_assert(matches_std_atomic<atomic_i8, std::int8_t>);
static_assert(matches_std_atomic<atomic_i16, std::int16_t>);
static_assert(matches_std_atomic<atomic_i32, std::int32_t>);
static_assert(matches_std_atomic<atomic_isize, std::ptrdiff_t>);
static_assert(matches_std_atomic<atomic_u8, std::uint8_t>);
static_assert(matches_std_atomic<atomic_u16, std::uint16_t>);
static_assert(matches_std_atomic<atomic_u32, std::uint32_t>);
static_assert(matches_std_atomic<atomic_usize, std::size_t>);
static_assert(matches_std_atomic<atomic_ptr<double>, double *>);

struct ring_header {
  atomic_usize head;
  atomic_usize tail;
  atomic_bool closed;
};

struct std_ring_header {
  std::atomic<std::size_t> head;
  std::atomic<std::size_t> tail;
  std::atomic<bool> closed;
};

static_assert(sizeof(ring_header) == sizeof(std_ring_header));
static_assert(alignof(ring_header) == alignof(std_ring_header));

#if MAYBESYNC_SYNC
static_assert(std::is_same_v<atomic_u32, std::atomic<std::uint32_t>>);
static_assert(ThreadSafe<atomic_usize>);
#else
static_assert(std::is_same_v<atomic_u32, local::cell<std::uint32_t>>);
static_assert(Transferable<atomic_usize> && !Shareable<atomic_usize>);
#endif

// =============================================================================
// Common Integral Surface
// =============================================================================

template <typename Atomic> void exercise_integral() {
  using T = typename Atomic::value_type;

  Atomic a{T(5)};
  assert(a.load() == T(5));
  assert(a.load(std::memory_order_acquire) == T(5));

  a.store(T(7));
  assert(a == T(7));
  a.store(T(8), std::memory_order_release);
  assert(a.load(std::memory_order_relaxed) == T(8));

  assert(a.exchange(T(10)) == T(10 - 2));
  assert(a.load() == T(10));

  T expected = T(3);
  assert(!a.compare_exchange_strong(expected, T(4)));
  assert(expected == T(10));
  assert(a.compare_exchange_strong(expected, T(4)));
  assert(a.load() == T(4));

  expected = T(4);
  while (!a.compare_exchange_weak(expected, T(6), std::memory_order_acq_rel,
                                  std::memory_order_acquire)) {
  }
  assert(a.load() == T(6));

  assert(a.fetch_add(T(2)) == T(6));
  assert(a.fetch_sub(T(1)) == T(8));
  assert(a.fetch_or(T(8)) == T(7));
  assert(a.fetch_and(T(12)) == T(15));
  assert(a.fetch_xor(T(4)) == T(12));
  assert(a.load() == T(8));

  assert(++a == T(9));
  assert(a++ == T(9));
  assert(--a == T(9));
  assert(a-- == T(9));
  assert((a += T(3)) == T(11));
  assert((a -= T(1)) == T(10));
  assert((a = T(0)) == T(0));
}

void test_integral_aliases() {
  TEST("signed aliases") {
    exercise_integral<atomic_i8>();
    exercise_integral<atomic_i16>();
    exercise_integral<atomic_i32>();
    exercise_integral<atomic_isize>();
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("unsigned aliases") {
    exercise_integral<atomic_u8>();
    exercise_integral<atomic_u16>();
    exercise_integral<atomic_u32>();
    exercise_integral<atomic_usize>();
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("arithmetic wraps on overflow") {
    atomic_i8 s{std::numeric_limits<std::int8_t>::max()};
    s.fetch_add(1);
    assert(s.load() == std::numeric_limits<std::int8_t>::min());
    s.fetch_sub(1);
    assert(s.load() == std::numeric_limits<std::int8_t>::max());

    atomic_u8 u{255};
    ++u;
    assert(u.load() == 0);
    --u;
    assert(u.load() == 255);

    atomic_usize z{0};
    z.fetch_sub(1);
    assert(z.load() == std::numeric_limits<std::size_t>::max());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Bool and Pointer Aliases
// =============================================================================

void test_bool_and_pointer() {
  TEST("atomic_bool") {
    atomic_bool flag{false};
    assert(!flag.load());
    assert(!flag.exchange(true));
    assert(flag.load());

    bool expected = false;
    assert(!flag.compare_exchange_strong(expected, false));
    assert(expected);
    assert(flag.compare_exchange_strong(expected, false));
    assert(!flag);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("atomic_ptr") {
    int slots[4] = {10, 20, 30, 40};
    atomic_ptr<int> p{slots};
    assert(*p.load() == 10);
    assert(p.fetch_add(2) == slots);
    assert(*p.load() == 30);
    assert(p.fetch_sub(1) == slots + 2);
    assert(++p == slots + 2);
    assert(p-- == slots + 2);
    assert((p += 3) == slots + 4);
    assert((p -= 4) == slots);

    int *expected = slots + 1;
    assert(!p.compare_exchange_strong(expected, nullptr));
    assert(expected == slots);
    assert(p.compare_exchange_strong(expected, nullptr));
    assert(p.load() == nullptr);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("ring header fields start at zero") {
    ring_header h{};
    h.tail.fetch_add(3);
    h.closed.store(true);
    assert(h.head.load() == 0);
    assert(h.tail.load() == 3);
    assert(h.closed.load());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

#if MAYBESYNC_SYNC

void test_concurrent_counters() {
  TEST("fetch_add from several threads") {
    atomic_usize counter{0};
    constexpr int threads = 4;
    constexpr int per_thread = 20000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
      workers.emplace_back([&counter] {
        for (int i = 0; i < per_thread; ++i)
          counter.fetch_add(1, std::memory_order_relaxed);
      });
    }
    for (auto &w : workers)
      w.join();

    assert(counter.load() == static_cast<std::size_t>(threads * per_thread));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

#endif

int main() {
  print_banner("atomic");

  test_integral_aliases();
  test_bool_and_pointer();
#if MAYBESYNC_SYNC
  test_concurrent_counters();
#endif

  return print_summary();
}
