#include "arena_error.hpp"
#include <ostream>

const char *to_string(ArenaError e) noexcept
{
    switch (e)
    {
    case ArenaError::InvalidCapacity:
        return "invalid capacity";
    case ArenaError::InvalidSize:
        return "invalid size";
    case ArenaError::InvalidAlignment:
        return "invalid alignment";
    case ArenaError::AllocationFailure:
        return "failed to allocate backing buffer";
    case ArenaError::OutOfMemory:
        return "arena out of memory";
    }
    return "unknown arena error";
}

std::ostream &operator<<(std::ostream &os, ArenaError e)
{
    return os << to_string(e);
}
