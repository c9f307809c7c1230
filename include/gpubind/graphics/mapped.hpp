// GpuBind Graphics Layer
// mapped.hpp - Scoped host access to a mapped buffer range

#pragma once

#include "buffer_resource.hpp"

#include <memory>
#include <span>

namespace gpubind::graphics {

namespace detail {

// Holds one sub-range of a mapped buffer. Releasing flushes mutable ranges and
// then returns the range to the buffer's MapContext.
class MappedGuard {
public:
    MappedGuard(std::shared_ptr<BufferResource> resource, ByteRange range, bool writable);
    ~MappedGuard();

    MappedGuard(MappedGuard&& other) noexcept;
    MappedGuard& operator=(MappedGuard&&) = delete;
    MappedGuard(const MappedGuard&) = delete;
    MappedGuard& operator=(const MappedGuard&) = delete;

    [[nodiscard]] ByteRange range() const { return range_; }

protected:
    [[nodiscard]] std::span<const std::byte> bytes() const { return mapped_->bytes(); }
    [[nodiscard]] std::span<std::byte> bytes_mut() { return mapped_->bytes_mut(); }

private:
    std::shared_ptr<BufferResource> resource_;
    ByteRange range_;
    std::unique_ptr<driver::MappedRange> mapped_;
    bool writable_;
};

}  // namespace detail

template<typename T>
class Mapped : public detail::MappedGuard {
public:
    using MappedGuard::MappedGuard;

    [[nodiscard]] const T& get() const { return *reinterpret_cast<const T*>(bytes().data()); }
    [[nodiscard]] const T& operator*() const { return get(); }
    [[nodiscard]] const T* operator->() const { return &get(); }
};

template<typename T>
class MappedSlice : public detail::MappedGuard {
public:
    using MappedGuard::MappedGuard;

    [[nodiscard]] std::span<const T> as_span() const {
        const auto raw = bytes();
        return {reinterpret_cast<const T*>(raw.data()), raw.size() / sizeof(T)};
    }

    [[nodiscard]] size_t size() const { return as_span().size(); }
    [[nodiscard]] const T& operator[](size_t index) const { return as_span()[index]; }
    [[nodiscard]] auto begin() const { return as_span().begin(); }
    [[nodiscard]] auto end() const { return as_span().end(); }
};

template<typename T>
class MappedMut : public detail::MappedGuard {
public:
    using MappedGuard::MappedGuard;

    [[nodiscard]] T& get() { return *reinterpret_cast<T*>(bytes_mut().data()); }
    [[nodiscard]] const T& get() const { return *reinterpret_cast<const T*>(bytes().data()); }
    [[nodiscard]] T& operator*() { return get(); }
    [[nodiscard]] T* operator->() { return &get(); }
};

template<typename T>
class MappedSliceMut : public detail::MappedGuard {
public:
    using MappedGuard::MappedGuard;

    [[nodiscard]] std::span<T> as_span() {
        const auto raw = bytes_mut();
        return {reinterpret_cast<T*>(raw.data()), raw.size() / sizeof(T)};
    }

    [[nodiscard]] std::span<const T> as_span() const {
        const auto raw = bytes();
        return {reinterpret_cast<const T*>(raw.data()), raw.size() / sizeof(T)};
    }

    [[nodiscard]] size_t size() const { return as_span().size(); }
    [[nodiscard]] T& operator[](size_t index) { return as_span()[index]; }
    [[nodiscard]] auto begin() { return as_span().begin(); }
    [[nodiscard]] auto end() { return as_span().end(); }
};

}  // namespace gpubind::graphics
