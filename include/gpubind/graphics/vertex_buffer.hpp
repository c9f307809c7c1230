// GpuBind Graphics Layer
// vertex_buffer.hpp - Vertex and index buffer ranges bound to render encoders

#pragma once

#include "buffer.hpp"
#include "pipeline.hpp"

#include <memory>

namespace gpubind::graphics {

class VertexBuffer {
public:
    template<Vertex V, BufferUsage U>
        requires(has_flag(U, BufferUsage::Vertex))
    VertexBuffer(const View<V[], U>& view)
        : resource_(view.resource()),
          offset_(view.offset()),
          size_(view.size_in_bytes()),
          layout_(VertexLayoutOf<V>::layout()) {}

    template<Vertex V, BufferUsage U>
        requires(has_flag(U, BufferUsage::Vertex))
    VertexBuffer(const Buffer<V[], U>& buffer) : VertexBuffer(buffer.view()) {}

    [[nodiscard]] const std::shared_ptr<detail::BufferResource>& resource() const { return resource_; }
    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] const driver::VertexBufferLayout& layout() const { return layout_; }

private:
    std::shared_ptr<detail::BufferResource> resource_;
    size_t offset_;
    size_t size_;
    driver::VertexBufferLayout layout_;
};

template<typename T>
concept IndexType = std::same_as<T, uint16_t> || std::same_as<T, uint32_t>;

class IndexBuffer {
public:
    template<IndexType I, BufferUsage U>
        requires(has_flag(U, BufferUsage::Index))
    IndexBuffer(const View<I[], U>& view)
        : resource_(view.resource()),
          offset_(view.offset()),
          len_(view.len()),
          format_(std::same_as<I, uint16_t> ? driver::IndexFormat::Uint16 : driver::IndexFormat::Uint32) {}

    template<IndexType I, BufferUsage U>
        requires(has_flag(U, BufferUsage::Index))
    IndexBuffer(const Buffer<I[], U>& buffer) : IndexBuffer(buffer.view()) {}

    [[nodiscard]] const std::shared_ptr<detail::BufferResource>& resource() const { return resource_; }
    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] size_t len() const { return len_; }
    [[nodiscard]] size_t size() const {
        return len_ * (format_ == driver::IndexFormat::Uint16 ? sizeof(uint16_t) : sizeof(uint32_t));
    }
    [[nodiscard]] driver::IndexFormat format() const { return format_; }

private:
    std::shared_ptr<detail::BufferResource> resource_;
    size_t offset_;
    size_t len_;
    driver::IndexFormat format_;
};

}  // namespace gpubind::graphics
