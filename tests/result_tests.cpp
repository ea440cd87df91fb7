#include <catch2/catch.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include "arena_result.hpp"

TEST_CASE("ArenaResult holds a value") {
  ArenaResult<int> r(7);
  REQUIRE(r.ok());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 7);
  REQUIRE(*r == 7);
  REQUIRE_THROWS_AS(r.error(), std::logic_error);
}

TEST_CASE("ArenaResult holds an error") {
  ArenaResult<int> r(ArenaError::OutOfMemory);
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.error() == ArenaError::OutOfMemory);
  REQUIRE_THROWS_AS(r.value(), std::logic_error);
}

TEST_CASE("value() on an error names the error") {
  ArenaResult<std::string> r(ArenaError::InvalidCapacity);
  try {
    (void)r.value();
    FAIL("value() did not throw");
  } catch (const std::logic_error& e) {
    REQUIRE(std::string(e.what()).find("invalid capacity") != std::string::npos);
  }
}

TEST_CASE("every error kind has a message") {
  for (ArenaError e : {ArenaError::InvalidCapacity, ArenaError::InvalidSize, ArenaError::InvalidAlignment,
                       ArenaError::AllocationFailure, ArenaError::OutOfMemory}) {
    REQUIRE(std::string(to_string(e)).size() > 0);
    std::ostringstream os;
    os << e;
    REQUIRE(os.str() == to_string(e));
  }
  REQUIRE(std::string(to_string(ArenaError::OutOfMemory)) == "arena out of memory");
}

TEST_CASE("rvalue value() moves the payload out") {
  ArenaResult<std::string> r(std::string("payload"));
  std::string s = std::move(r).value();
  REQUIRE(s == "payload");
}
