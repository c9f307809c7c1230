// GpuBind Graphics Layer
// render_bundle.hpp - Reusable pre-recorded render commands

#pragma once

#include "encoder_state.hpp"
#include "pass_state.hpp"
#include "pipeline.hpp"

#include <gpubind/core/assert.hpp>

#include <concepts>
#include <memory>
#include <vector>

namespace gpubind::graphics {

class Device;

class RenderBundle {
public:
    RenderBundle(std::shared_ptr<driver::RenderBundle> handle, RenderTargetLayout layout,
                 std::vector<std::shared_ptr<const void>> retained);

    [[nodiscard]] const driver::RenderBundle& handle() const { return *shared_->handle; }
    [[nodiscard]] const RenderTargetLayout& layout() const { return layout_; }

    // Keeps the driver bundle and everything it references alive
    [[nodiscard]] std::shared_ptr<const void> keep_alive() const { return shared_; }

private:
    struct Shared {
        std::shared_ptr<driver::RenderBundle> handle;
        std::vector<std::shared_ptr<const void>> retained;
    };

    std::shared_ptr<const Shared> shared_;
    RenderTargetLayout layout_;
};

namespace detail {

struct RenderBundleParts {
    std::unique_ptr<driver::RenderBundleEncoder> encoder;
    RenderStateTracker state;
    RenderTargetLayout layout;
    std::vector<std::shared_ptr<const void>> retained;
};

}  // namespace detail

// Records pipeline, binding and draw commands for later execution in render
// passes with the same target layout
template<typename P = NoPipeline, typename V = NoVertexBuffers, typename I = NoIndexBuffer, typename R = NoBindGroups>
class RenderBundleEncoder {
public:
    RenderBundleEncoder(RenderBundleEncoder&&) noexcept = default;
    RenderBundleEncoder& operator=(RenderBundleEncoder&&) noexcept = default;
    RenderBundleEncoder(const RenderBundleEncoder&) = delete;
    RenderBundleEncoder& operator=(const RenderBundleEncoder&) = delete;

    [[nodiscard]] const RenderTargetLayout& layout() const { return parts_.layout; }

    [[nodiscard]] RenderBundleEncoder<PipelineSet, V, I, R> set_pipeline(const RenderPipeline& pipeline) && {
        GPUBIND_ASSERT(pipeline.target_layout() == parts_.layout,
                       "pipeline render target layout is incompatible with the render bundle");
        if (parts_.state.set_pipeline(*parts_.encoder, pipeline)) {
            parts_.retained.push_back(pipeline.handle_ptr());
        }
        return RenderBundleEncoder<PipelineSet, V, I, R>(std::move(parts_));
    }

    [[nodiscard]] RenderBundleEncoder<P, VertexBuffersSet, I, R> set_vertex_buffer(uint32_t slot,
                                                                                   const VertexBuffer& buffer) && {
        bind_vertex_buffer(slot, buffer);
        return RenderBundleEncoder<P, VertexBuffersSet, I, R>(std::move(parts_));
    }

    // Binds the buffers to consecutive slots starting from 0
    template<typename... Bs>
        requires(std::convertible_to<const Bs&, VertexBuffer> && ...)
    [[nodiscard]] RenderBundleEncoder<P, VertexBuffersSet, I, R> set_vertex_buffers(const Bs&... buffers) && {
        uint32_t slot = 0;
        (bind_vertex_buffer(slot++, VertexBuffer(buffers)), ...);
        return RenderBundleEncoder<P, VertexBuffersSet, I, R>(std::move(parts_));
    }

    [[nodiscard]] RenderBundleEncoder<P, V, IndexBufferSet, R> set_index_buffer(const IndexBuffer& buffer) && {
        if (parts_.state.set_index_buffer(*parts_.encoder, buffer)) {
            parts_.retained.push_back(buffer.resource());
        }
        return RenderBundleEncoder<P, V, IndexBufferSet, R>(std::move(parts_));
    }

    [[nodiscard]] RenderBundleEncoder<P, V, I, BindGroupsSet> set_bind_group(uint32_t index,
                                                                             const BindGroup& bind_group) && {
        bind(index, bind_group);
        return RenderBundleEncoder<P, V, I, BindGroupsSet>(std::move(parts_));
    }

    template<std::same_as<BindGroup>... Gs>
    [[nodiscard]] RenderBundleEncoder<P, V, I, BindGroupsSet> set_bind_groups(const Gs&... bind_groups) && {
        uint32_t index = 0;
        (bind(index++, bind_groups), ...);
        return RenderBundleEncoder<P, V, I, BindGroupsSet>(std::move(parts_));
    }

    [[nodiscard]] RenderBundleEncoder draw(uint32_t vertex_count, uint32_t instance_count = 1,
                                           uint32_t first_vertex = 0, uint32_t first_instance = 0) &&
        requires std::same_as<P, PipelineSet>
    {
        parts_.state.draw(*parts_.encoder, {vertex_count, instance_count, first_vertex, first_instance});
        return std::move(*this);
    }

    [[nodiscard]] RenderBundleEncoder draw_indexed(uint32_t index_count, uint32_t instance_count = 1,
                                                   uint32_t first_index = 0, int32_t base_vertex = 0,
                                                   uint32_t first_instance = 0) &&
        requires(std::same_as<P, PipelineSet> && std::same_as<I, IndexBufferSet>)
    {
        parts_.state.draw_indexed(*parts_.encoder,
                                  {index_count, instance_count, first_index, base_vertex, first_instance});
        return std::move(*this);
    }

    template<BufferUsage U>
    [[nodiscard]] RenderBundleEncoder draw_indirect(const View<driver::Draw, U>& arguments) &&
        requires(std::same_as<P, PipelineSet> && has_flag(U, BufferUsage::Indirect))
    {
        parts_.state.draw_indirect(*parts_.encoder, arguments.resource()->handle(), arguments.offset());
        parts_.retained.push_back(arguments.resource());
        return std::move(*this);
    }

    template<BufferUsage U>
    [[nodiscard]] RenderBundleEncoder draw_indexed_indirect(const View<driver::DrawIndexed, U>& arguments) &&
        requires(std::same_as<P, PipelineSet> && std::same_as<I, IndexBufferSet> &&
                 has_flag(U, BufferUsage::Indirect))
    {
        parts_.state.draw_indexed_indirect(*parts_.encoder, arguments.resource()->handle(), arguments.offset());
        parts_.retained.push_back(arguments.resource());
        return std::move(*this);
    }

    [[nodiscard]] RenderBundle finish() && {
        auto handle = parts_.encoder->finish();
        parts_.encoder.reset();
        return RenderBundle(std::move(handle), std::move(parts_.layout), std::move(parts_.retained));
    }

private:
    template<typename, typename, typename, typename>
    friend class RenderBundleEncoder;
    friend class Device;

    explicit RenderBundleEncoder(detail::RenderBundleParts parts) : parts_(std::move(parts)) {}

    void bind(uint32_t index, const BindGroup& bind_group) {
        if (parts_.state.set_bind_group(*parts_.encoder, index, bind_group)) {
            parts_.retained.push_back(bind_group.keep_alive());
        }
    }

    void bind_vertex_buffer(uint32_t slot, const VertexBuffer& buffer) {
        if (parts_.state.set_vertex_buffer(*parts_.encoder, slot, buffer)) {
            parts_.retained.push_back(buffer.resource());
        }
    }

    detail::RenderBundleParts parts_;
};

}  // namespace gpubind::graphics
