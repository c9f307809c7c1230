// GpuBind Graphics Layer
// view.hpp - Typed views into a buffer's byte range

#pragma once

#include "binding.hpp"
#include "buffer_resource.hpp"
#include "image_copy.hpp"
#include "mapped.hpp"
#include "projection.hpp"
#include "range.hpp"

#include <gpubind/core/assert.hpp>

#include <concepts>
#include <memory>
#include <optional>
#include <type_traits>

namespace gpubind::graphics {

using driver::BufferUsage;

// Storage for a T that has not been written yet. Reads are refused until the
// buffer is converted with assume_init().
template<typename T>
struct Uninit {
    alignas(T) std::byte bytes[sizeof(T)];
};

template<typename T>
inline constexpr bool is_uninit_v = false;

template<typename T>
inline constexpr bool is_uninit_v<Uninit<T>> = true;

template<typename T>
concept BufferData = std::is_trivially_copyable_v<T> && std::is_object_v<T> && !std::is_array_v<T> &&
                     !std::is_pointer_v<T>;

template<BufferUsage U>
inline constexpr bool is_mappable_v = has_flag(U, BufferUsage::MapRead | BufferUsage::MapWrite);

// ============================================================================
// Single Value View
// ============================================================================

template<typename T, BufferUsage U>
class View {
    static_assert(BufferData<T>, "buffer elements must be trivially copyable values");

public:
    using element_type = T;
    static constexpr BufferUsage usage = U;

    View(std::shared_ptr<detail::BufferResource> resource, size_t offset)
        : resource_(std::move(resource)), offset_(offset) {}

    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] static constexpr size_t size_in_bytes() { return sizeof(T); }
    [[nodiscard]] ByteRange byte_range() const { return {offset_, offset_ + sizeof(T)}; }
    [[nodiscard]] uint64_t id() const { return resource_->id(); }
    [[nodiscard]] const std::shared_ptr<detail::BufferResource>& resource() const { return resource_; }

    [[nodiscard]] MapFuture map_read() const
        requires(has_flag(U, BufferUsage::MapRead) && !is_uninit_v<T>)
    {
        return resource_->map_async(driver::MapMode::Read, byte_range());
    }

    [[nodiscard]] MapFuture map_write() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return resource_->map_async(driver::MapMode::Write, byte_range());
    }

    [[nodiscard]] Mapped<T> mapped() const
        requires(is_mappable_v<U> && !is_uninit_v<T>)
    {
        return Mapped<T>(resource_, byte_range(), false);
    }

    [[nodiscard]] MappedMut<T> mapped_mut() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return MappedMut<T>(resource_, byte_range(), true);
    }

    // Narrows the view to one field of T without touching the GPU
    template<typename F>
    [[nodiscard]] View<F, U> project(const Projection<T, F>& projection) const {
        return View<F, U>(resource_, offset_ + projection.offset());
    }

    [[nodiscard]] Uniform<T> uniform() const
        requires(has_flag(U, BufferUsage::Uniform))
    {
        return Uniform<T>(make_buffer_binding(resource_, offset_, sizeof(T), driver::BufferBindingType::Uniform));
    }

    template<StorageAccess A = StorageAccess::Read>
    [[nodiscard]] Storage<T, A> storage() const
        requires(has_flag(U, BufferUsage::Storage))
    {
        constexpr auto type = A == StorageAccess::Read ? driver::BufferBindingType::ReadOnlyStorage
                                                       : driver::BufferBindingType::Storage;
        return Storage<T, A>(make_buffer_binding(resource_, offset_, sizeof(T), type));
    }

private:
    std::shared_ptr<detail::BufferResource> resource_;
    size_t offset_;
};

// ============================================================================
// Slice View
// ============================================================================

template<typename T, BufferUsage U>
class View<T[], U> {
    static_assert(BufferData<T>, "buffer elements must be trivially copyable values");

public:
    using element_type = T;
    static constexpr BufferUsage usage = U;

    View(std::shared_ptr<detail::BufferResource> resource, size_t offset, size_t len)
        : resource_(std::move(resource)), offset_(offset), len_(len) {}

    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] size_t len() const { return len_; }
    [[nodiscard]] bool empty() const { return len_ == 0; }
    [[nodiscard]] size_t size_in_bytes() const { return len_ * sizeof(T); }
    [[nodiscard]] ByteRange byte_range() const { return {offset_, offset_ + size_in_bytes()}; }
    [[nodiscard]] uint64_t id() const { return resource_->id(); }
    [[nodiscard]] const std::shared_ptr<detail::BufferResource>& resource() const { return resource_; }

    [[nodiscard]] std::optional<View<T, U>> get(size_t index) const {
        if (index >= len_) {
            return std::nullopt;
        }
        return get_unchecked(index);
    }

    template<SliceRange R>
    [[nodiscard]] std::optional<View> get(const R& range) const {
        auto bounds = checked_bounds(range, len_);
        if (!bounds.has_value()) {
            return std::nullopt;
        }
        return slice(*bounds);
    }

    // The caller guarantees the index or range is in bounds
    [[nodiscard]] View<T, U> get_unchecked(size_t index) const {
        return View<T, U>(resource_, offset_ + index * sizeof(T));
    }

    template<SliceRange R>
    [[nodiscard]] View get_unchecked(const R& range) const {
        return slice(*to_exclusive(range, len_));
    }

    [[nodiscard]] View<T, U> operator[](size_t index) const {
        GPUBIND_ASSERT(index < len_, "index {} out of bounds for a slice of length {}", index, len_);
        return get_unchecked(index);
    }

    template<SliceRange R>
    [[nodiscard]] View operator[](const R& range) const {
        auto bounds = checked_bounds(range, len_);
        GPUBIND_ASSERT(bounds.has_value(), "range out of bounds for a slice of length {}", len_);
        return slice(*bounds);
    }

    [[nodiscard]] MapFuture map_read() const
        requires(has_flag(U, BufferUsage::MapRead) && !is_uninit_v<T>)
    {
        return resource_->map_async(driver::MapMode::Read, byte_range());
    }

    [[nodiscard]] MapFuture map_write() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return resource_->map_async(driver::MapMode::Write, byte_range());
    }

    [[nodiscard]] MappedSlice<T> mapped() const
        requires(is_mappable_v<U> && !is_uninit_v<T>)
    {
        return MappedSlice<T>(resource_, byte_range(), false);
    }

    [[nodiscard]] MappedSliceMut<T> mapped_mut() const
        requires(has_flag(U, BufferUsage::MapWrite))
    {
        return MappedSliceMut<T>(resource_, byte_range(), true);
    }

    template<StorageAccess A = StorageAccess::Read>
    [[nodiscard]] Storage<T[], A> storage() const
        requires(has_flag(U, BufferUsage::Storage))
    {
        constexpr auto type = A == StorageAccess::Read ? driver::BufferBindingType::ReadOnlyStorage
                                                       : driver::BufferBindingType::Storage;
        return Storage<T[], A>(make_buffer_binding(resource_, offset_, size_in_bytes(), type));
    }

    // Texel-typed endpoint, the element size is the format's block size
    [[nodiscard]] ImageCopyBuffer<U> image_copy_buffer(const ImageCopyBufferLayout& layout) const
        requires(!std::same_as<T, std::byte> && has_flag(U, BufferUsage::CopySrc | BufferUsage::CopyDst))
    {
        return ImageCopyBuffer<U>(detail::make_image_copy_buffer(resource_, offset_, size_in_bytes(), sizeof(T),
                                                                 layout.blocks_per_row, layout.rows_per_image));
    }

    [[nodiscard]] ImageCopyBuffer<U> image_copy_buffer_raw(const ImageCopyBufferRawLayout& layout) const
        requires(std::same_as<T, std::byte> && has_flag(U, BufferUsage::CopySrc | BufferUsage::CopyDst))
    {
        return ImageCopyBuffer<U>(detail::make_image_copy_buffer(resource_, offset_, size_in_bytes(),
                                                                 layout.bytes_per_block, layout.blocks_per_row,
                                                                 layout.rows_per_image));
    }

private:
    [[nodiscard]] View slice(const Range& bounds) const {
        return View(resource_, offset_ + bounds.start * sizeof(T), bounds.end - bounds.start);
    }

    std::shared_ptr<detail::BufferResource> resource_;
    size_t offset_;
    size_t len_;
};

}  // namespace gpubind::graphics
