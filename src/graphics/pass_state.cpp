// GpuBind Graphics Layer
// pass_state.cpp - Redundant state elision and draw/dispatch validation

#include <gpubind/graphics/pass_state.hpp>

#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>

namespace gpubind::graphics::detail {

// ============================================================================
// Bind Groups
// ============================================================================

bool BindGroupTracker::set_bind_group(driver::ProgrammablePassEncoder& encoder, uint32_t index,
                                      const BindGroup& bind_group) {
    if (index < bound_.size() && bound_[index].has_value() && bound_[index]->id == bind_group.id()) {
        GPUBIND_LOG_TRACE(core::LogCategory::Command, "Skipping redundant set_bind_group({})", index);
        return false;
    }
    if (index >= bound_.size()) {
        bound_.resize(index + 1);
    }
    bound_[index] = Bound{bind_group.id(), bind_group.layout()};
    encoder.set_bind_group(index, bind_group.handle());
    return true;
}

void BindGroupTracker::validate(const std::vector<BindGroupLayout>& layouts) const {
    for (size_t i = 0; i < layouts.size(); ++i) {
        GPUBIND_ASSERT(i < bound_.size() && bound_[i].has_value(), "bind group {} is not set", i);
        GPUBIND_ASSERT(bound_[i]->layout.is_compatible(layouts[i]),
                       "bind group {} layout is incompatible with the pipeline", i);
    }
}

// ============================================================================
// Compute
// ============================================================================

bool ComputeStateTracker::set_pipeline(driver::ComputePassEncoder& encoder, const ComputePipeline& pipeline) {
    if (pipeline_id_ == pipeline.id()) {
        GPUBIND_LOG_TRACE(core::LogCategory::Command, "Skipping redundant set_pipeline");
        return false;
    }
    pipeline_id_ = pipeline.id();
    pipeline_layouts_ = pipeline.bind_group_layouts();
    encoder.set_pipeline(pipeline.handle());
    return true;
}

bool ComputeStateTracker::set_bind_group(driver::ComputePassEncoder& encoder, uint32_t index,
                                         const BindGroup& bind_group) {
    return bind_groups_.set_bind_group(encoder, index, bind_group);
}

void ComputeStateTracker::validate_dispatch() const {
    GPUBIND_ASSERT(pipeline_id_.has_value(), "dispatch requires a compute pipeline");
    bind_groups_.validate(pipeline_layouts_);
}

void ComputeStateTracker::dispatch(driver::ComputePassEncoder& encoder, uint32_t x, uint32_t y, uint32_t z) const {
    validate_dispatch();
    encoder.dispatch_workgroups(x, y, z);
}

void ComputeStateTracker::dispatch_indirect(driver::ComputePassEncoder& encoder, const driver::Buffer& buffer,
                                            size_t offset) const {
    validate_dispatch();
    GPUBIND_ASSERT(offset % 4 == 0, "indirect offset {} must be a multiple of 4", offset);
    encoder.dispatch_workgroups_indirect(buffer, offset);
}

// ============================================================================
// Render
// ============================================================================

bool RenderStateTracker::set_pipeline(driver::RenderEncoder& encoder, const RenderPipeline& pipeline) {
    if (pipeline_.has_value() && pipeline_->id == pipeline.id()) {
        GPUBIND_LOG_TRACE(core::LogCategory::Command, "Skipping redundant set_pipeline");
        return false;
    }
    pipeline_ = BoundPipeline{pipeline.id(), pipeline.bind_group_layouts(), pipeline.vertex_layouts(),
                              pipeline.topology(), pipeline.strip_index_format()};
    encoder.set_pipeline(pipeline.handle());
    return true;
}

bool RenderStateTracker::set_bind_group(driver::RenderEncoder& encoder, uint32_t index, const BindGroup& bind_group) {
    return bind_groups_.set_bind_group(encoder, index, bind_group);
}

bool RenderStateTracker::set_vertex_buffer(driver::RenderEncoder& encoder, uint32_t slot,
                                           const VertexBuffer& buffer) {
    const uint64_t id = buffer.resource()->id();
    if (slot < vertex_buffers_.size() && vertex_buffers_[slot].has_value()) {
        auto& bound = *vertex_buffers_[slot];
        if (bound.id == id && bound.offset == buffer.offset() && bound.size == buffer.size()) {
            // Same bytes, possibly viewed as another vertex type
            bound.layout = buffer.layout();
            GPUBIND_LOG_TRACE(core::LogCategory::Command, "Skipping redundant set_vertex_buffer({})", slot);
            return false;
        }
    }
    if (slot >= vertex_buffers_.size()) {
        vertex_buffers_.resize(slot + 1);
    }
    vertex_buffers_[slot] = BoundVertexBuffer{id, buffer.offset(), buffer.size(), buffer.layout()};
    encoder.set_vertex_buffer({slot, &buffer.resource()->handle(), buffer.offset(), buffer.size()});
    return true;
}

bool RenderStateTracker::set_index_buffer(driver::RenderEncoder& encoder, const IndexBuffer& buffer) {
    const uint64_t id = buffer.resource()->id();
    if (index_buffer_.has_value() && index_buffer_->id == id && index_buffer_->offset == buffer.offset() &&
        index_buffer_->len == buffer.len() && index_buffer_->format == buffer.format()) {
        GPUBIND_LOG_TRACE(core::LogCategory::Command, "Skipping redundant set_index_buffer");
        return false;
    }
    index_buffer_ = BoundIndexBuffer{id, buffer.offset(), buffer.len(), buffer.format()};
    encoder.set_index_buffer({&buffer.resource()->handle(), buffer.format(), buffer.offset(), buffer.size()});
    return true;
}

const RenderStateTracker::BoundPipeline& RenderStateTracker::validate_bindings() const {
    GPUBIND_ASSERT(pipeline_.has_value(), "draw requires a render pipeline");
    bind_groups_.validate(pipeline_->bind_group_layouts);

    const auto& layouts = pipeline_->vertex_layouts;
    for (size_t slot = 0; slot < layouts.size(); ++slot) {
        GPUBIND_ASSERT(slot < vertex_buffers_.size() && vertex_buffers_[slot].has_value(),
                       "vertex buffer {} is not set", slot);
        GPUBIND_ASSERT(vertex_buffers_[slot]->layout == layouts[slot],
                       "vertex buffer {} layout does not match the pipeline", slot);
    }
    return *pipeline_;
}

void RenderStateTracker::validate_vertex_range(uint32_t first_vertex, uint32_t vertex_count, uint32_t first_instance,
                                               uint32_t instance_count) const {
    const auto& layouts = pipeline_->vertex_layouts;
    for (size_t slot = 0; slot < layouts.size(); ++slot) {
        const auto& layout = layouts[slot];
        if (layout.array_stride == 0) {
            continue;
        }
        const auto available = vertex_buffers_[slot]->size / layout.array_stride;
        const bool per_instance = layout.step_mode == driver::VertexStepMode::Instance;
        const uint64_t end = per_instance ? uint64_t{first_instance} + instance_count
                                          : uint64_t{first_vertex} + vertex_count;
        GPUBIND_ASSERT(end <= available, "draw reads {} {} from vertex buffer {} which holds {}", end,
                       per_instance ? "instances" : "vertices", slot, available);
    }
}

void RenderStateTracker::validate_index_format(const BoundPipeline& pipeline) const {
    GPUBIND_ASSERT(index_buffer_.has_value(), "indexed draw requires an index buffer");
    if (is_strip_topology(pipeline.topology)) {
        GPUBIND_ASSERT(pipeline.strip_index_format == index_buffer_->format,
                       "index buffer format does not match the strip index format of the pipeline");
    }
}

void RenderStateTracker::draw(driver::RenderEncoder& encoder, const driver::Draw& op) const {
    validate_bindings();
    validate_vertex_range(op.first_vertex, op.vertex_count, op.first_instance, op.instance_count);
    encoder.draw(op);
}

void RenderStateTracker::draw_indexed(driver::RenderEncoder& encoder, const driver::DrawIndexed& op) const {
    const auto& pipeline = validate_bindings();
    validate_index_format(pipeline);
    GPUBIND_ASSERT(uint64_t{op.first_index} + op.index_count <= index_buffer_->len,
                   "indices [{}, {}) out of bounds for an index buffer of {} indices", op.first_index,
                   uint64_t{op.first_index} + op.index_count, index_buffer_->len);
    encoder.draw_indexed(op);
}

void RenderStateTracker::draw_indirect(driver::RenderEncoder& encoder, const driver::Buffer& buffer,
                                       size_t offset) const {
    validate_bindings();
    GPUBIND_ASSERT(offset % 4 == 0, "indirect offset {} must be a multiple of 4", offset);
    encoder.draw_indirect(buffer, offset);
}

void RenderStateTracker::draw_indexed_indirect(driver::RenderEncoder& encoder, const driver::Buffer& buffer,
                                               size_t offset) const {
    validate_index_format(validate_bindings());
    GPUBIND_ASSERT(offset % 4 == 0, "indirect offset {} must be a multiple of 4", offset);
    encoder.draw_indexed_indirect(buffer, offset);
}

void RenderStateTracker::clear() {
    pipeline_.reset();
    bind_groups_.clear();
    vertex_buffers_.clear();
    index_buffer_.reset();
}

}  // namespace gpubind::graphics::detail
