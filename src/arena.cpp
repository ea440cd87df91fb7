#include "arena.hpp"
#include <algorithm>
#include <cassert>

namespace
{
// Largest power of two not above x (x >= 1).
std::size_t floor_pow2(std::size_t x) noexcept
{
    std::size_t p = 1;
    while (p <= x / 2)
        p <<= 1;
    return p;
}
} // namespace

ArenaResult<Arena> Arena::create(std::size_t capacity)
{
    if (capacity == 0)
        return ArenaError::InvalidCapacity;
    // Offsets must stay representable as pointer differences.
    if (capacity > static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max()))
        return ArenaError::AllocationFailure;

    std::shared_ptr<std::uint64_t> generation;
    try
    {
        generation = std::make_shared<std::uint64_t>(0);
    }
    catch (const std::bad_alloc &)
    {
        return ArenaError::AllocationFailure;
    }

    // Aligning the buffer to floor_pow2(capacity) makes every offset
    // multiple of an alignment that fits also an aligned address.
    const std::size_t alignment = std::max(kBufferAlignment, floor_pow2(capacity));
    void *mem = ::operator new(capacity, std::align_val_t{alignment}, std::nothrow);
    if (mem == nullptr)
        return ArenaError::AllocationFailure;

    return Arena(static_cast<std::byte *>(mem), capacity, alignment, std::move(generation));
}

Arena::Arena(std::byte *buffer, std::size_t capacity, std::size_t alignment,
             std::shared_ptr<std::uint64_t> generation) noexcept
    : buffer_(buffer), capacity_(capacity), cursor_(0), alignment_(alignment), generation_(std::move(generation))
{
}

Arena::~Arena()
{
    release();
}

Arena::Arena(Arena &&other) noexcept
    : buffer_(std::exchange(other.buffer_, nullptr)),
      capacity_(std::exchange(other.capacity_, 0)),
      cursor_(std::exchange(other.cursor_, 0)),
      alignment_(std::exchange(other.alignment_, kBufferAlignment)),
      generation_(std::move(other.generation_))
{
}

Arena &Arena::operator=(Arena &&other) noexcept
{
    if (this != &other)
    {
        release();
        buffer_ = std::exchange(other.buffer_, nullptr);
        capacity_ = std::exchange(other.capacity_, 0);
        cursor_ = std::exchange(other.cursor_, 0);
        alignment_ = std::exchange(other.alignment_, kBufferAlignment);
        generation_ = std::move(other.generation_);
    }
    return *this;
}

ArenaResult<void *> Arena::allocate_bytes(std::size_t size, std::size_t align) noexcept
{
    if (align == 0 || (align & (align - 1)) != 0)
        return ArenaError::InvalidAlignment;
    if (size == 0)
        return static_cast<void *>(nullptr);
    if (align > alignment_)
        return ArenaError::InvalidAlignment;

    const std::size_t padding = (align - (cursor_ & (align - 1))) & (align - 1);

    // cursor + padding + size <= capacity, written so neither side can overflow
    const std::size_t left = capacity_ - cursor_;
    if (padding > left || size > left - padding)
        return ArenaError::OutOfMemory;

    std::byte *out = buffer_ + cursor_ + padding;
    cursor_ += padding + size;
    assert(cursor_ <= capacity_);
    return static_cast<void *>(out);
}

void Arena::reset() noexcept
{
    if (cursor_ != 0 && generation_)
        ++*generation_;
    cursor_ = 0;
}

void Arena::release() noexcept
{
    if (buffer_ != nullptr)
        ::operator delete(buffer_, std::align_val_t{alignment_});
    // Handles may outlive this arena; leave them seeing a newer generation.
    if (generation_)
        ++*generation_;
    buffer_ = nullptr;
    capacity_ = 0;
    cursor_ = 0;
    alignment_ = kBufferAlignment;
    generation_.reset();
}
