// GpuBind Graphics Layer
// buffer.hpp - Owning typed GPU buffers

#pragma once

#include "view.hpp"

#include <memory>
#include <utility>

namespace gpubind::graphics {

// Owns a GPU buffer holding one T. Views, bindings and recorded commands keep
// the underlying resource alive after the Buffer itself is gone.
template<typename T, BufferUsage U>
class Buffer {
    static_assert(is_valid_buffer_usage(U), "MapRead may only be combined with CopyDst, MapWrite only with CopySrc");

public:
    using element_type = T;
    static constexpr BufferUsage usage = U;

    explicit Buffer(std::shared_ptr<detail::BufferResource> resource) : resource_(std::move(resource)) {
        GPUBIND_ASSERT(resource_->size() >= sizeof(T), "buffer of {} bytes can't hold a {} byte value",
                       resource_->size(), sizeof(T));
    }

    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] View<T, U> view() const { return View<T, U>(resource_, 0); }

    [[nodiscard]] uint64_t id() const { return resource_->id(); }
    [[nodiscard]] static constexpr size_t size_in_bytes() { return sizeof(T); }
    [[nodiscard]] bool is_mapped() const { return resource_->is_mapped(); }
    [[nodiscard]] driver::Buffer& handle() const { return resource_->handle(); }
    [[nodiscard]] const std::shared_ptr<detail::BufferResource>& resource() const { return resource_; }
    [[nodiscard]] std::shared_ptr<detail::BufferResource> into_resource() && { return std::move(resource_); }

    [[nodiscard]] MapFuture map_read() const
        requires(has_flag(U, BufferUsage::MapRead) && !is_uninit_v<T>)
    {
        return view().map_read();
    }

    [[nodiscard]] MapFuture map_write() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return view().map_write();
    }

    [[nodiscard]] Mapped<T> mapped() const
        requires(is_mappable_v<U> && !is_uninit_v<T>)
    {
        return view().mapped();
    }

    [[nodiscard]] MappedMut<T> mapped_mut() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return view().mapped_mut();
    }

    // Fatal while mapped guards are alive
    void unmap() const { resource_->unmap(); }

    // Frees the GPU memory now, later map requests fail with MapError::Destroyed
    void destroy() const { resource_->handle().destroy(); }

    template<typename F>
    [[nodiscard]] View<F, U> project(const Projection<T, F>& projection) const {
        return view().project(projection);
    }

    [[nodiscard]] Uniform<T> uniform() const
        requires(has_flag(U, BufferUsage::Uniform))
    {
        return view().uniform();
    }

    template<StorageAccess A = StorageAccess::Read>
    [[nodiscard]] Storage<T, A> storage() const
        requires(has_flag(U, BufferUsage::Storage))
    {
        return view().template storage<A>();
    }

private:
    std::shared_ptr<detail::BufferResource> resource_;
};

// Owns a GPU buffer holding a run of T
template<typename T, BufferUsage U>
class Buffer<T[], U> {
    static_assert(is_valid_buffer_usage(U), "MapRead may only be combined with CopyDst, MapWrite only with CopySrc");

public:
    using element_type = T;
    static constexpr BufferUsage usage = U;

    explicit Buffer(std::shared_ptr<detail::BufferResource> resource)
        : resource_(std::move(resource)), len_(resource_->size() / sizeof(T)) {}

    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] View<T[], U> view() const { return View<T[], U>(resource_, 0, len_); }

    [[nodiscard]] uint64_t id() const { return resource_->id(); }
    [[nodiscard]] size_t len() const { return len_; }
    [[nodiscard]] bool empty() const { return len_ == 0; }
    [[nodiscard]] size_t size_in_bytes() const { return len_ * sizeof(T); }
    [[nodiscard]] bool is_mapped() const { return resource_->is_mapped(); }
    [[nodiscard]] driver::Buffer& handle() const { return resource_->handle(); }
    [[nodiscard]] const std::shared_ptr<detail::BufferResource>& resource() const { return resource_; }
    [[nodiscard]] std::shared_ptr<detail::BufferResource> into_resource() && { return std::move(resource_); }

    [[nodiscard]] std::optional<View<T, U>> get(size_t index) const { return view().get(index); }

    template<SliceRange R>
    [[nodiscard]] std::optional<View<T[], U>> get(const R& range) const {
        return view().get(range);
    }

    [[nodiscard]] View<T, U> get_unchecked(size_t index) const { return view().get_unchecked(index); }

    template<SliceRange R>
    [[nodiscard]] View<T[], U> get_unchecked(const R& range) const {
        return view().get_unchecked(range);
    }

    [[nodiscard]] View<T, U> operator[](size_t index) const { return view()[index]; }

    template<SliceRange R>
    [[nodiscard]] View<T[], U> operator[](const R& range) const {
        return view()[range];
    }

    [[nodiscard]] MapFuture map_read() const
        requires(has_flag(U, BufferUsage::MapRead) && !is_uninit_v<T>)
    {
        return view().map_read();
    }

    [[nodiscard]] MapFuture map_write() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return view().map_write();
    }

    [[nodiscard]] MappedSlice<T> mapped() const
        requires(is_mappable_v<U> && !is_uninit_v<T>)
    {
        return view().mapped();
    }

    [[nodiscard]] MappedSliceMut<T> mapped_mut() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return view().mapped_mut();
    }

    void unmap() const { resource_->unmap(); }
    void destroy() const { resource_->handle().destroy(); }

    template<StorageAccess A = StorageAccess::Read>
    [[nodiscard]] Storage<T[], A> storage() const
        requires(has_flag(U, BufferUsage::Storage))
    {
        return view().template storage<A>();
    }

    [[nodiscard]] ImageCopyBuffer<U> image_copy_buffer(const ImageCopyBufferLayout& layout) const
        requires(!std::same_as<T, std::byte> && has_flag(U, BufferUsage::CopySrc | BufferUsage::CopyDst))
    {
        return view().image_copy_buffer(layout);
    }

    [[nodiscard]] ImageCopyBuffer<U> image_copy_buffer_raw(const ImageCopyBufferRawLayout& layout) const
        requires(std::same_as<T, std::byte> && has_flag(U, BufferUsage::CopySrc | BufferUsage::CopyDst))
    {
        return view().image_copy_buffer_raw(layout);
    }

private:
    std::shared_ptr<detail::BufferResource> resource_;
    size_t len_;
};

// Declares the contents of an uninitialized buffer written. The caller
// guarantees every byte has been initialized, through a mapping or a GPU copy.
template<typename T, BufferUsage U>
[[nodiscard]] Buffer<T, U> assume_init(Buffer<Uninit<T>, U>&& buffer) {
    return Buffer<T, U>(std::move(buffer).into_resource());
}

template<typename T, BufferUsage U>
[[nodiscard]] Buffer<T[], U> assume_init(Buffer<Uninit<T>[], U>&& buffer) {
    return Buffer<T[], U>(std::move(buffer).into_resource());
}

}  // namespace gpubind::graphics
