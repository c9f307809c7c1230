// GpuBind Graphics Layer
// queue.hpp - Command submission and direct buffer/texture writes

#pragma once

#include "command_encoder.hpp"
#include "texture.hpp"
#include "view.hpp"

#include <gpubind/core/assert.hpp>
#include <gpubind/driver/driver.hpp>

#include <span>

namespace gpubind::graphics {

class Queue {
public:
    explicit Queue(driver::Queue& queue) : queue_(&queue) {}

    void submit(const CommandBuffer& command_buffer) const;

    // Offset and size must be multiples of 4
    template<BufferData T, BufferUsage U>
        requires(has_flag(U, BufferUsage::CopyDst))
    void write_buffer(const View<T, U>& view, const T& value) const {
        write_buffer_bytes(*view.resource(), view.offset(), std::as_bytes(std::span<const T, 1>(&value, 1)));
    }

    template<BufferData T, BufferUsage U>
        requires(has_flag(U, BufferUsage::CopyDst))
    void write_buffer(const View<T[], U>& view, std::span<const T> data) const {
        GPUBIND_ASSERT(data.size() == view.len(), "data has {} elements but the view has {}", data.size(),
                       view.len());
        write_buffer_bytes(*view.resource(), view.offset(), std::as_bytes(data));
    }

    // data must hold the copy extent laid out as described by layout
    void write_texture(const ImageCopyTexture& destination, std::span<const std::byte> data,
                       const driver::ImageDataLayout& layout, const ImageCopySize3D& size) const;

    template<BufferData T>
    void write_texture(const ImageCopyTexture& destination, std::span<const T> texels,
                       const driver::ImageDataLayout& layout, const ImageCopySize3D& size) const {
        write_texture(destination, std::as_bytes(texels), layout, size);
    }

private:
    void write_buffer_bytes(detail::BufferResource& buffer, size_t offset, std::span<const std::byte> data) const;

    driver::Queue* queue_;
};

}  // namespace gpubind::graphics
