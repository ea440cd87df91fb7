#pragma once
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

// Typed view of storage carved out of an Arena: `size()` consecutive T
// starting at `data()`. The handle remembers the arena generation it was
// issued in. Once the arena is reset the handle is stale and must not be
// dereferenced; builds without NDEBUG assert on it, release builds do not
// check. The handle shares the arena's generation cell, so it can still tell
// it is stale after the arena was destroyed or assigned over.
template <class T>
class ArenaHandle
{
public:
    using value_type = T;
    using size_type = std::size_t;
    using reference = T &;
    using pointer = T *;
    using iterator = T *;

    ArenaHandle() noexcept = default;
    ArenaHandle(T *data, size_type count, std::shared_ptr<const std::uint64_t> generation) noexcept
        : data_(data), size_(count), generation_(std::move(generation)), issued_(generation_ ? *generation_ : 0)
    {
    }

    // False once the issuing arena has been reset, destroyed or assigned over.
    bool is_current() const noexcept { return generation_ == nullptr || *generation_ == issued_; }

    size_type size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    pointer data() const noexcept
    {
        check_current();
        return data_;
    }
    pointer get() const noexcept { return data(); }

    reference operator*() const noexcept
    {
        assert(size_ > 0);
        return *data();
    }
    pointer operator->() const noexcept { return data(); }

    reference operator[](size_type i) const noexcept
    {
        assert(i < size_);
        return data()[i];
    }

    iterator begin() const noexcept { return data(); }
    iterator end() const noexcept { return data() + size_; }

private:
    void check_current() const noexcept
    {
        assert(is_current() && "arena handle used after reset");
    }

    T *data_ = nullptr;
    size_type size_ = 0;
    std::shared_ptr<const std::uint64_t> generation_;
    std::uint64_t issued_ = 0;
};
