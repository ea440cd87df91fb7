#pragma once
#include <iosfwd>

// Every way an arena operation can fail. All of them are returned to the
// caller as values; none is thrown.
enum class ArenaError
{
    InvalidCapacity,   // create() with capacity 0
    InvalidSize,       // array byte size overflows size_t
    InvalidAlignment,  // alignment is 0 or not a power of two
    AllocationFailure, // host allocator refused the backing buffer
    OutOfMemory        // not enough room left, padding included
};

const char *to_string(ArenaError e) noexcept;
std::ostream &operator<<(std::ostream &os, ArenaError e);
