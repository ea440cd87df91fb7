#include <catch2/catch.hpp>
#include <cstddef>
#include <limits>
#include <utility>
#include "arena.hpp"

TEST_CASE("create with positive capacity starts empty") {
  for (std::size_t cap : {std::size_t{1}, std::size_t{7}, std::size_t{16}, std::size_t{4096}, std::size_t{1} << 20}) {
    auto r = Arena::create(cap);
    REQUIRE(r.ok());
    REQUIRE(r->total_bytes() == cap);
    REQUIRE(r->remaining_bytes() == cap);
    REQUIRE(r->used_bytes() == 0);
    REQUIRE(r->generation() == 0);
  }
}

TEST_CASE("create(0) fails with InvalidCapacity") {
  auto r = Arena::create(0);
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.error() == ArenaError::InvalidCapacity);
}

TEST_CASE("create reports AllocationFailure when the buffer cannot be had") {
  auto r = Arena::create(std::numeric_limits<std::size_t>::max());
  REQUIRE_FALSE(r);
  REQUIRE(r.error() == ArenaError::AllocationFailure);
}

TEST_CASE("create reports AllocationFailure when the allocator refuses") {
  auto r = Arena::create(static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max()));
  REQUIRE_FALSE(r);
  REQUIRE(r.error() == ArenaError::AllocationFailure);
}

TEST_CASE("buffer alignment grows with capacity") {
  REQUIRE(Arena::create(1).value().buffer_alignment() == Arena::kBufferAlignment);
  REQUIRE(Arena::create(64).value().buffer_alignment() == 64);
  REQUIRE(Arena::create(100).value().buffer_alignment() == 64);
  REQUIRE(Arena::create(4096).value().buffer_alignment() == 4096);
}

TEST_CASE("moving an arena keeps its buffer and its handles") {
  Arena a = Arena::create(64).value();
  auto h = a.construct<int>(41).value();
  REQUIRE(a.used_bytes() == sizeof(int));

  Arena b = std::move(a);
  REQUIRE(b.total_bytes() == 64);
  REQUIRE(b.used_bytes() == sizeof(int));
  REQUIRE(h.is_current());
  *h += 1;
  REQUIRE(*h == 42);

  // moved-from: nothing left to hand out
  REQUIRE(a.total_bytes() == 0);
  REQUIRE(a.remaining_bytes() == 0);
  auto fail = a.allocate<int>();
  REQUIRE_FALSE(fail);
  REQUIRE(fail.error() == ArenaError::OutOfMemory);

  b.reset();
  REQUIRE_FALSE(h.is_current());
}

TEST_CASE("move assignment releases the target's old buffer") {
  Arena a = Arena::create(32).value();
  Arena b = Arena::create(128).value();
  REQUIRE(b.allocate<double>().ok());

  b = std::move(a);
  REQUIRE(b.total_bytes() == 32);
  REQUIRE(b.used_bytes() == 0);
  REQUIRE(a.total_bytes() == 0);
}

TEST_CASE("assigning over an arena makes its handles stale") {
  Arena a = Arena::create(32).value();
  Arena b = Arena::create(32).value();
  auto h = b.construct<int>(1).value();
  REQUIRE(h.is_current());

  b = std::move(a);
  REQUIRE_FALSE(h.is_current());
}

TEST_CASE("handles outliving their arena report stale") {
  ArenaHandle<int> h;
  {
    Arena arena = Arena::create(16).value();
    h = arena.construct<int>(3).value();
    REQUIRE(h.is_current());
  }
  REQUIRE_FALSE(h.is_current());
}
