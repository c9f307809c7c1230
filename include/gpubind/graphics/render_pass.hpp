// GpuBind Graphics Layer
// render_pass.hpp - Render pass encoder

#pragma once

#include "command_encoder.hpp"
#include "pass_state.hpp"
#include "render_bundle.hpp"
#include "render_target.hpp"

#include <gpubind/core/assert.hpp>

#include <concepts>
#include <memory>
#include <vector>

namespace gpubind::graphics {

namespace detail {

struct RenderPassParts {
    CommandEncoder encoder;
    std::unique_ptr<driver::RenderPassEncoder> pass;
    RenderStateTracker state;
    RenderTargetLayout layout;
    std::shared_ptr<driver::QuerySet> occlusion_query_set;
    std::vector<bool> used_occlusion_queries;
};

}  // namespace detail

// P pipeline, V vertex buffers, I index buffer, R bind groups, Q occlusion query phase.
// Draws require a pipeline, indexed draws an index buffer as well. A pass with
// an open occlusion query can't end.
template<typename P, typename V, typename I, typename R, OcclusionQueryState Q>
class RenderPassEncoder {
public:
    RenderPassEncoder(RenderPassEncoder&&) noexcept = default;
    RenderPassEncoder& operator=(RenderPassEncoder&&) noexcept = default;
    RenderPassEncoder(const RenderPassEncoder&) = delete;
    RenderPassEncoder& operator=(const RenderPassEncoder&) = delete;

    [[nodiscard]] const RenderTargetLayout& layout() const { return parts_.layout; }

    // ========================================================================
    // Bindings
    // ========================================================================

    [[nodiscard]] RenderPassEncoder<PipelineSet, V, I, R, Q> set_pipeline(const RenderPipeline& pipeline) && {
        GPUBIND_ASSERT(pipeline.target_layout() == parts_.layout,
                       "pipeline render target layout is incompatible with the render pass");
        if (parts_.state.set_pipeline(*parts_.pass, pipeline)) {
            parts_.encoder.retain(pipeline.handle_ptr());
        }
        return RenderPassEncoder<PipelineSet, V, I, R, Q>(std::move(parts_));
    }

    [[nodiscard]] RenderPassEncoder<P, VertexBuffersSet, I, R, Q> set_vertex_buffer(uint32_t slot,
                                                                                    const VertexBuffer& buffer) && {
        bind_vertex_buffer(slot, buffer);
        return RenderPassEncoder<P, VertexBuffersSet, I, R, Q>(std::move(parts_));
    }

    // Binds the buffers to consecutive slots starting from 0
    template<typename... Bs>
        requires(std::convertible_to<const Bs&, VertexBuffer> && ...)
    [[nodiscard]] RenderPassEncoder<P, VertexBuffersSet, I, R, Q> set_vertex_buffers(const Bs&... buffers) && {
        uint32_t slot = 0;
        (bind_vertex_buffer(slot++, VertexBuffer(buffers)), ...);
        return RenderPassEncoder<P, VertexBuffersSet, I, R, Q>(std::move(parts_));
    }

    [[nodiscard]] RenderPassEncoder<P, V, IndexBufferSet, R, Q> set_index_buffer(const IndexBuffer& buffer) && {
        if (parts_.state.set_index_buffer(*parts_.pass, buffer)) {
            parts_.encoder.retain(buffer.resource());
        }
        return RenderPassEncoder<P, V, IndexBufferSet, R, Q>(std::move(parts_));
    }

    [[nodiscard]] RenderPassEncoder<P, V, I, BindGroupsSet, Q> set_bind_group(uint32_t index,
                                                                              const BindGroup& bind_group) && {
        bind(index, bind_group);
        return RenderPassEncoder<P, V, I, BindGroupsSet, Q>(std::move(parts_));
    }

    template<std::same_as<BindGroup>... Gs>
    [[nodiscard]] RenderPassEncoder<P, V, I, BindGroupsSet, Q> set_bind_groups(const Gs&... bind_groups) && {
        uint32_t index = 0;
        (bind(index++, bind_groups), ...);
        return RenderPassEncoder<P, V, I, BindGroupsSet, Q>(std::move(parts_));
    }

    // ========================================================================
    // Fixed Function State
    // ========================================================================

    [[nodiscard]] RenderPassEncoder set_viewport(const driver::Viewport& viewport) && {
        GPUBIND_ASSERT(viewport.min_depth >= 0.0f && viewport.min_depth <= viewport.max_depth &&
                           viewport.max_depth <= 1.0f,
                       "viewport depth range [{}, {}] must lie within [0, 1]", viewport.min_depth,
                       viewport.max_depth);
        parts_.pass->set_viewport(viewport);
        return std::move(*this);
    }

    [[nodiscard]] RenderPassEncoder set_scissor_rect(const driver::ScissorRect& rect) && {
        parts_.pass->set_scissor_rect(rect);
        return std::move(*this);
    }

    [[nodiscard]] RenderPassEncoder set_blend_constant(const driver::BlendConstant& color) && {
        parts_.pass->set_blend_constant(color);
        return std::move(*this);
    }

    [[nodiscard]] RenderPassEncoder set_stencil_reference(uint32_t reference) && {
        parts_.pass->set_stencil_reference(reference);
        return std::move(*this);
    }

    // ========================================================================
    // Draws
    // ========================================================================

    [[nodiscard]] RenderPassEncoder draw(uint32_t vertex_count, uint32_t instance_count = 1,
                                         uint32_t first_vertex = 0, uint32_t first_instance = 0) &&
        requires std::same_as<P, PipelineSet>
    {
        parts_.state.draw(*parts_.pass, {vertex_count, instance_count, first_vertex, first_instance});
        return std::move(*this);
    }

    [[nodiscard]] RenderPassEncoder draw_indexed(uint32_t index_count, uint32_t instance_count = 1,
                                                 uint32_t first_index = 0, int32_t base_vertex = 0,
                                                 uint32_t first_instance = 0) &&
        requires(std::same_as<P, PipelineSet> && std::same_as<I, IndexBufferSet>)
    {
        parts_.state.draw_indexed(*parts_.pass, {index_count, instance_count, first_index, base_vertex, first_instance});
        return std::move(*this);
    }

    template<BufferUsage U>
    [[nodiscard]] RenderPassEncoder draw_indirect(const View<driver::Draw, U>& arguments) &&
        requires(std::same_as<P, PipelineSet> && has_flag(U, BufferUsage::Indirect))
    {
        parts_.state.draw_indirect(*parts_.pass, arguments.resource()->handle(), arguments.offset());
        parts_.encoder.retain(arguments.resource());
        return std::move(*this);
    }

    template<BufferUsage U>
    [[nodiscard]] RenderPassEncoder draw_indexed_indirect(const View<driver::DrawIndexed, U>& arguments) &&
        requires(std::same_as<P, PipelineSet> && std::same_as<I, IndexBufferSet> &&
                 has_flag(U, BufferUsage::Indirect))
    {
        parts_.state.draw_indexed_indirect(*parts_.pass, arguments.resource()->handle(), arguments.offset());
        parts_.encoder.retain(arguments.resource());
        return std::move(*this);
    }

    // ========================================================================
    // Occlusion Queries
    // ========================================================================

    // Each query index may be used once per pass
    [[nodiscard]] RenderPassEncoder<P, V, I, R, OcclusionQueryStarted> begin_occlusion_query(uint32_t index) &&
        requires CanBeginOcclusionQuery<Q>
    {
        auto& used = parts_.used_occlusion_queries;
        GPUBIND_ASSERT(index < used.size(), "occlusion query index {} out of bounds for a query set of {}", index,
                       used.size());
        GPUBIND_ASSERT(!used[index], "occlusion query {} was already used in this render pass", index);
        used[index] = true;
        parts_.pass->begin_occlusion_query(index);
        return RenderPassEncoder<P, V, I, R, OcclusionQueryStarted>(std::move(parts_));
    }

    [[nodiscard]] RenderPassEncoder<P, V, I, R, OcclusionQueryEnded> end_occlusion_query() &&
        requires std::same_as<Q, OcclusionQueryStarted>
    {
        parts_.pass->end_occlusion_query();
        return RenderPassEncoder<P, V, I, R, OcclusionQueryEnded>(std::move(parts_));
    }

    // ========================================================================
    // Bundles and Pass End
    // ========================================================================

    // Bundles leave the driver state undefined, so every binding is reset
    template<std::same_as<RenderBundle>... Bs>
    [[nodiscard]] InitialRenderPassEncoder<Q> execute_bundles(const Bs&... bundles) && {
        std::vector<const driver::RenderBundle*> handles;
        handles.reserve(sizeof...(Bs));
        (add_bundle(handles, bundles), ...);
        parts_.pass->execute_bundles(handles);
        parts_.state.clear();
        return InitialRenderPassEncoder<Q>(std::move(parts_));
    }

    [[nodiscard]] InitialRenderPassEncoder<Q> execute_bundle(const RenderBundle& bundle) && {
        return std::move(*this).execute_bundles(bundle);
    }

    // Forgets every binding so the next set_* calls reach the driver
    [[nodiscard]] InitialRenderPassEncoder<Q> clear_state() && {
        parts_.state.clear();
        return InitialRenderPassEncoder<Q>(std::move(parts_));
    }

    [[nodiscard]] CommandEncoder end() &&
        requires(!std::same_as<Q, OcclusionQueryStarted>)
    {
        parts_.pass->end();
        parts_.pass.reset();
        return std::move(parts_.encoder);
    }

private:
    template<typename, typename, typename, typename, OcclusionQueryState>
    friend class RenderPassEncoder;
    friend class CommandEncoder;

    explicit RenderPassEncoder(detail::RenderPassParts parts) : parts_(std::move(parts)) {}

    void bind(uint32_t index, const BindGroup& bind_group) {
        if (parts_.state.set_bind_group(*parts_.pass, index, bind_group)) {
            parts_.encoder.retain(bind_group.keep_alive());
        }
    }

    void bind_vertex_buffer(uint32_t slot, const VertexBuffer& buffer) {
        if (parts_.state.set_vertex_buffer(*parts_.pass, slot, buffer)) {
            parts_.encoder.retain(buffer.resource());
        }
    }

    void add_bundle(std::vector<const driver::RenderBundle*>& handles, const RenderBundle& bundle) {
        GPUBIND_ASSERT(bundle.layout() == parts_.layout, "render bundle layout is incompatible with the render pass");
        handles.push_back(&bundle.handle());
        parts_.encoder.retain(bundle.keep_alive());
    }

    detail::RenderPassParts parts_;
};

template<OcclusionQueryState Q>
InitialRenderPassEncoder<Q> CommandEncoder::begin_render_pass(RenderPassDescriptor<Q> descriptor) && {
    const auto& query_set = descriptor.occlusion_query_set_handle();
    auto pass = open_render_pass(descriptor.target(), query_set);
    const size_t query_count = query_set ? query_set->count() : 0;
    auto layout = descriptor.target().layout();
    return InitialRenderPassEncoder<Q>(detail::RenderPassParts{
        std::move(*this), std::move(pass), {}, std::move(layout), query_set, std::vector<bool>(query_count, false)});
}

}  // namespace gpubind::graphics
