// GpuBind Graphics Layer
// pipeline.cpp - Pipeline identity and descriptor validation

#include <gpubind/graphics/pipeline.hpp>

#include <gpubind/core/assert.hpp>

#include <atomic>

namespace gpubind::graphics {

namespace {

uint64_t next_pipeline_id() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

RenderTargetLayout target_layout_of(const RenderPipelineDescriptor& desc) {
    RenderTargetLayout layout;
    layout.color_formats.reserve(desc.color_targets.size());
    for (const auto& target : desc.color_targets) {
        layout.color_formats.push_back(target.format);
    }
    if (desc.depth_stencil.has_value()) {
        layout.depth_stencil_format = desc.depth_stencil->format;
    }
    layout.sample_count = desc.sample_count;
    return layout;
}

}  // namespace

ComputePipeline::ComputePipeline(std::shared_ptr<driver::ComputePipeline> handle,
                                 std::vector<BindGroupLayout> bind_group_layouts)
    : handle_(std::move(handle)), bind_group_layouts_(std::move(bind_group_layouts)), id_(next_pipeline_id()) {}

RenderPipeline::RenderPipeline(std::shared_ptr<driver::RenderPipeline> handle,
                               std::vector<BindGroupLayout> bind_group_layouts, const RenderPipelineDescriptor& desc)
    : handle_(std::move(handle)),
      bind_group_layouts_(std::move(bind_group_layouts)),
      vertex_layouts_(desc.vertex_buffer_layouts),
      topology_(desc.topology),
      strip_index_format_(desc.strip_index_format),
      target_layout_(target_layout_of(desc)),
      id_(next_pipeline_id()) {}

namespace detail {

bool is_strip_topology(driver::PrimitiveTopology topology) {
    return topology == driver::PrimitiveTopology::LineStrip || topology == driver::PrimitiveTopology::TriangleStrip;
}

void validate_render_pipeline_descriptor(const RenderPipelineDescriptor& desc) {
    GPUBIND_ASSERT(desc.layout != nullptr && desc.vertex_module != nullptr,
                   "render pipeline requires a layout and a vertex module");
    GPUBIND_ASSERT(!desc.strip_index_format.has_value() || is_strip_topology(desc.topology),
                   "strip index format is only allowed for strip topologies");
    GPUBIND_ASSERT(!desc.color_targets.empty() || desc.depth_stencil.has_value(),
                   "render pipeline must have a color target or a depth-stencil state");
    if (!desc.color_targets.empty()) {
        GPUBIND_ASSERT(desc.fragment_module != nullptr, "color targets require a fragment module");
    }
    GPUBIND_ASSERT(desc.sample_count == 1 || desc.sample_count == 4, "sample count must be 1 or 4, got {}",
                   desc.sample_count);
}

}  // namespace detail

}  // namespace gpubind::graphics
