#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "arena_error.hpp"
#include "arena_handle.hpp"
#include "arena_result.hpp"

// Fixed-capacity bump arena over one heap buffer.
// Storage is handed out front to back and reclaimed only all at once by
// reset(). Nothing placed in the arena is ever destroyed, so typed requests
// are limited to trivially destructible types.
//
// Two contracts are left to the caller and are not checked in release builds:
//  * allocate() and allocate_array() return UNINITIALIZED storage. Write a T
//    into it before reading through the handle; reading first is undefined
//    behaviour. construct() does the write for you.
//  * handles issued before reset() are stale afterwards and must not be
//    dereferenced. Debug builds assert on this (see ArenaHandle).
//
// Single owner only: nothing here is synchronized.
class Arena
{
public:
    // Least alignment of the backing buffer. The real one is raised to the
    // largest power of two not above the capacity, so any alignment a type
    // can have and still fit is honoured by rounding the offset alone.
    static constexpr std::size_t kBufferAlignment = alignof(std::max_align_t);

    // Fails with InvalidCapacity for 0 and AllocationFailure when the buffer
    // cannot be obtained.
    static ArenaResult<Arena> create(std::size_t capacity);

    ~Arena();

    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;

    // Outstanding handles stay valid across a move. The moved-from arena has
    // capacity 0. Handles of an arena that is assigned over go stale.
    Arena(Arena &&other) noexcept;
    Arena &operator=(Arena &&other) noexcept;

    // Room for one uninitialized T.
    template <class T>
    ArenaResult<ArenaHandle<T>> allocate()
    {
        static_assert(std::is_object_v<T>, "arena stores objects only");
        static_assert(std::is_trivially_destructible_v<T>,
                      "arena never runs destructors; T must be trivially destructible");
        ArenaResult<void *> raw = allocate_bytes(sizeof(T), alignof(T));
        if (!raw)
            return raw.error();
        return ArenaHandle<T>(static_cast<T *>(*raw), 1, generation_);
    }

    // Room for `count` contiguous uninitialized T. count == 0 yields an empty
    // handle and leaves the cursor alone.
    template <class T>
    ArenaResult<ArenaHandle<T>> allocate_array(std::size_t count)
    {
        static_assert(std::is_object_v<T>, "arena stores objects only");
        static_assert(std::is_trivially_destructible_v<T>,
                      "arena never runs destructors; T must be trivially destructible");
        if (count == 0)
            return ArenaHandle<T>();
        if (count > std::numeric_limits<std::size_t>::max() / sizeof(T))
            return ArenaError::InvalidSize;
        ArenaResult<void *> raw = allocate_bytes(count * sizeof(T), alignof(T));
        if (!raw)
            return raw.error();
        return ArenaHandle<T>(static_cast<T *>(*raw), count, generation_);
    }

    // allocate<T>() followed by in-place construction from args. If the
    // constructor throws, the storage stays consumed until the next reset().
    template <class T, class... Args>
    ArenaResult<ArenaHandle<T>> construct(Args &&...args)
    {
        ArenaResult<ArenaHandle<T>> slot = allocate<T>();
        if (!slot)
            return slot;
        void *where = slot->data();
        if constexpr (std::is_constructible_v<T, Args...>)
            ::new (where) T(std::forward<Args>(args)...);
        else
            ::new (where) T{std::forward<Args>(args)...};
        return slot;
    }

    // Untyped request: `size` bytes at an offset that is a multiple of
    // `align`. A zero-byte request succeeds with nullptr and does not move
    // the cursor. An alignment above buffer_alignment() cannot be placed
    // and is InvalidAlignment; it exceeds the capacity anyway.
    ArenaResult<void *> allocate_bytes(std::size_t size, std::size_t align) noexcept;

    // Rewinds the cursor to 0. Contents are left as they are and every
    // handle issued so far becomes stale.
    void reset() noexcept;

    std::size_t remaining_bytes() const noexcept { return capacity_ - cursor_; }
    std::size_t used_bytes() const noexcept { return cursor_; }
    std::size_t total_bytes() const noexcept { return capacity_; }
    std::size_t buffer_alignment() const noexcept { return alignment_; }

    // Count of resets that reclaimed something. Handles compare against it.
    std::uint64_t generation() const noexcept { return generation_ ? *generation_ : 0; }

private:
    Arena(std::byte *buffer, std::size_t capacity, std::size_t alignment,
          std::shared_ptr<std::uint64_t> generation) noexcept;
    void release() noexcept;

    std::byte *buffer_ = nullptr;
    std::size_t capacity_ = 0;
    std::size_t cursor_ = 0;
    std::size_t alignment_ = kBufferAlignment;
    // Shared with every handle issued. Bumped on reset and on release.
    std::shared_ptr<std::uint64_t> generation_;
};
