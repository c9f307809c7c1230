// GpuBind Graphics Layer
// pass_state.hpp - Bound-state tracking shared by the pass encoders
//
// The trackers remember what is currently bound on a driver pass encoder,
// skip state-setting calls that would rebind the same thing, and check at
// draw/dispatch time that the bound resources match the bound pipeline.

#pragma once

#include "bind_group.hpp"
#include "pipeline.hpp"
#include "vertex_buffer.hpp"

#include <gpubind/driver/driver.hpp>

#include <optional>
#include <vector>

namespace gpubind::graphics::detail {

class BindGroupTracker {
public:
    // Returns false when the same bind group is already bound at index
    bool set_bind_group(driver::ProgrammablePassEncoder& encoder, uint32_t index, const BindGroup& bind_group);

    // Fatal unless every layout has a compatible bind group bound at its index
    void validate(const std::vector<BindGroupLayout>& layouts) const;

    void clear() { bound_.clear(); }

private:
    struct Bound {
        uint64_t id;
        BindGroupLayout layout;
    };

    std::vector<std::optional<Bound>> bound_;
};

class ComputeStateTracker {
public:
    bool set_pipeline(driver::ComputePassEncoder& encoder, const ComputePipeline& pipeline);
    bool set_bind_group(driver::ComputePassEncoder& encoder, uint32_t index, const BindGroup& bind_group);

    void dispatch(driver::ComputePassEncoder& encoder, uint32_t x, uint32_t y, uint32_t z) const;
    void dispatch_indirect(driver::ComputePassEncoder& encoder, const driver::Buffer& buffer, size_t offset) const;

private:
    void validate_dispatch() const;

    std::optional<uint64_t> pipeline_id_;
    std::vector<BindGroupLayout> pipeline_layouts_;
    BindGroupTracker bind_groups_;
};

class RenderStateTracker {
public:
    bool set_pipeline(driver::RenderEncoder& encoder, const RenderPipeline& pipeline);
    bool set_bind_group(driver::RenderEncoder& encoder, uint32_t index, const BindGroup& bind_group);
    bool set_vertex_buffer(driver::RenderEncoder& encoder, uint32_t slot, const VertexBuffer& buffer);
    bool set_index_buffer(driver::RenderEncoder& encoder, const IndexBuffer& buffer);

    void draw(driver::RenderEncoder& encoder, const driver::Draw& op) const;
    void draw_indexed(driver::RenderEncoder& encoder, const driver::DrawIndexed& op) const;
    void draw_indirect(driver::RenderEncoder& encoder, const driver::Buffer& buffer, size_t offset) const;
    void draw_indexed_indirect(driver::RenderEncoder& encoder, const driver::Buffer& buffer, size_t offset) const;

    // Forgets every binding, the next set_* call always reaches the driver
    void clear();

private:
    struct BoundPipeline {
        uint64_t id;
        std::vector<BindGroupLayout> bind_group_layouts;
        std::vector<driver::VertexBufferLayout> vertex_layouts;
        driver::PrimitiveTopology topology;
        std::optional<driver::IndexFormat> strip_index_format;
    };

    struct BoundVertexBuffer {
        uint64_t id;
        size_t offset;
        size_t size;
        driver::VertexBufferLayout layout;
    };

    struct BoundIndexBuffer {
        uint64_t id;
        size_t offset;
        size_t len;
        driver::IndexFormat format;
    };

    // Returns the bound pipeline, fatal when bindings don't match it
    const BoundPipeline& validate_bindings() const;
    void validate_vertex_range(uint32_t first_vertex, uint32_t vertex_count, uint32_t first_instance,
                               uint32_t instance_count) const;
    void validate_index_format(const BoundPipeline& pipeline) const;

    std::optional<BoundPipeline> pipeline_;
    BindGroupTracker bind_groups_;
    std::vector<std::optional<BoundVertexBuffer>> vertex_buffers_;
    std::optional<BoundIndexBuffer> index_buffer_;
};

}  // namespace gpubind::graphics::detail
