// GpuBind Graphics Layer
// device.cpp - Resource creation and validation

#include <gpubind/graphics/device.hpp>
#include <gpubind/graphics/mapped.hpp>

#include <gpubind/core/assert.hpp>
#include <gpubind/core/config.hpp>
#include <gpubind/core/logger.hpp>

#include <cstring>
#include <set>

namespace gpubind::graphics {

Device::Device(std::shared_ptr<driver::Device> device) : device_(std::move(device)), queue_(device_->queue()) {}

Device Device::create(const DeviceDescriptor& desc) {
    auto device = driver::create_device(desc);
    GPUBIND_LOG_INFO(core::LogCategory::Device, "Created device '{}' on the {} backend", desc.label,
                     device->backend_name());
    return Device(std::move(device));
}

Device Device::from_config(const core::Config& config) {
    return create(driver::device_descriptor_from_config(config));
}

// ============================================================================
// Buffers
// ============================================================================

std::shared_ptr<detail::BufferResource> Device::create_buffer_resource(size_t size, BufferUsage usage,
                                                                       bool mapped_at_creation) const {
    driver::BufferDescriptor desc;
    desc.size = size;
    desc.usage = usage;
    desc.mapped_at_creation = mapped_at_creation;

    auto buffer = device_->create_buffer(desc);
    GPUBIND_ASSERT(buffer != nullptr, "driver failed to allocate a buffer of {} bytes", size);
    auto resource = std::make_shared<detail::BufferResource>(device_, std::move(buffer), mapped_at_creation);
    GPUBIND_LOG_TRACE(core::LogCategory::Buffer, "Created buffer {} of {} bytes", resource->id(), size);
    return resource;
}

std::shared_ptr<detail::BufferResource> Device::create_buffer_init(std::span<const std::byte> data,
                                                                   BufferUsage usage, bool stay_mapped) const {
    auto resource = create_buffer_resource(data.size(), usage, true);
    if (!data.empty()) {
        MappedSliceMut<std::byte> mapped(resource, ByteRange{0, data.size()}, true);
        std::memcpy(mapped.as_span().data(), data.data(), data.size());
    }
    if (!stay_mapped) {
        resource->unmap();
    }
    return resource;
}

// ============================================================================
// Textures, Samplers and Queries
// ============================================================================

Texture Device::create_texture(const TextureDescriptor& desc) const {
    detail::validate_texture_descriptor(desc);
    const uint32_t mip_level_count = desc.mipmap_levels.resolve(desc.size, desc.dimension);

    driver::TextureDescriptor driver_desc;
    driver_desc.size = desc.size;
    driver_desc.mip_level_count = mip_level_count;
    driver_desc.sample_count = desc.sample_count;
    driver_desc.dimension = desc.dimension;
    driver_desc.format = desc.format;
    driver_desc.usage = desc.usage;
    driver_desc.view_formats = desc.view_formats;
    driver_desc.label = desc.label;

    GPUBIND_LOG_TRACE(core::LogCategory::Texture, "Creating {}x{}x{} `{}` texture with {} mip levels",
                      desc.size.width, desc.size.height, desc.size.depth_or_layers, format::to_string(desc.format),
                      mip_level_count);
    return Texture(device_->create_texture(driver_desc), desc, mip_level_count);
}

Sampler Device::create_sampler(const driver::SamplerDescriptor& desc) const {
    GPUBIND_ASSERT(desc.lod_min_clamp >= 0.0f && desc.lod_min_clamp <= desc.lod_max_clamp,
                   "invalid lod clamp range [{}, {}]", desc.lod_min_clamp, desc.lod_max_clamp);
    GPUBIND_ASSERT(desc.max_anisotropy >= 1, "max anisotropy must be at least 1");
    if (desc.max_anisotropy > 1) {
        GPUBIND_ASSERT(desc.magnification_filter == driver::FilterMode::Linear &&
                           desc.minification_filter == driver::FilterMode::Linear &&
                           desc.mipmap_filter == driver::FilterMode::Linear,
                       "anisotropic filtering requires linear filters");
    }
    return Sampler(device_->create_sampler(desc), desc);
}

OcclusionQuerySet Device::create_occlusion_query_set(uint32_t len) const {
    detail::validate_query_set_len(len);
    GPUBIND_LOG_TRACE(core::LogCategory::Query, "Creating occlusion query set of {}", len);
    return OcclusionQuerySet(device_->create_query_set({driver::QueryType::Occlusion, len}));
}

TimestampQuerySet Device::create_timestamp_query_set(uint32_t len) const {
    detail::validate_query_set_len(len);
    GPUBIND_LOG_TRACE(core::LogCategory::Query, "Creating timestamp query set of {}", len);
    return TimestampQuerySet(device_->create_query_set({driver::QueryType::Timestamp, len}));
}

// ============================================================================
// Binding and Pipelines
// ============================================================================

BindGroupLayout Device::create_bind_group_layout(std::vector<driver::BindGroupLayoutEntry> entries) const {
    std::set<uint32_t> bindings;
    for (const auto& entry : entries) {
        GPUBIND_ASSERT(bindings.insert(entry.binding).second, "binding {} is declared twice", entry.binding);
    }
    auto handle = device_->create_bind_group_layout({entries});
    return BindGroupLayout(std::move(handle), std::move(entries));
}

PipelineLayout Device::create_pipeline_layout(std::vector<BindGroupLayout> bind_group_layouts) const {
    driver::PipelineLayoutDescriptor desc;
    desc.bind_group_layouts.reserve(bind_group_layouts.size());
    for (const auto& layout : bind_group_layouts) {
        desc.bind_group_layouts.push_back(&layout.handle());
    }
    return PipelineLayout(device_->create_pipeline_layout(desc), std::move(bind_group_layouts));
}

BindGroup Device::create_bind_group(const BindGroupLayout& layout, const std::vector<BindGroupEntry>& entries) const {
    detail::validate_bind_group_entries(layout, entries);

    driver::BindGroupDescriptor desc;
    desc.layout = &layout.handle();
    std::vector<std::shared_ptr<const void>> retained;

    for (const auto& entry : entries) {
        if (const auto* buffer = std::get_if<BufferBinding>(&entry.resource)) {
            desc.entries.push_back({entry.binding, buffer->to_driver()});
            retained.push_back(buffer->resource);
        } else if (const auto* view = std::get_if<TextureView>(&entry.resource)) {
            desc.entries.push_back({entry.binding, &view->handle()});
            retained.push_back(view->handle_ptr());
            retained.push_back(view->texture_ptr());
        } else {
            const auto& sampler = std::get<Sampler>(entry.resource);
            desc.entries.push_back({entry.binding, &sampler.handle()});
            retained.push_back(sampler.handle_ptr());
        }
    }
    return BindGroup(device_->create_bind_group(desc), layout, std::move(retained));
}

ShaderModule Device::create_shader_module(const driver::ShaderModuleDescriptor& desc) const {
    return ShaderModule(device_->create_shader_module(desc));
}

ComputePipeline Device::create_compute_pipeline(const ComputePipelineDescriptor& desc) const {
    GPUBIND_ASSERT(desc.layout != nullptr && desc.shader_module != nullptr,
                   "compute pipeline requires a layout and a shader module");

    driver::ComputePipelineDescriptor driver_desc;
    driver_desc.layout = &desc.layout->handle();
    driver_desc.shader_module = &desc.shader_module->handle();
    driver_desc.entry_point = desc.entry_point;
    driver_desc.constants = desc.constants;
    return ComputePipeline(device_->create_compute_pipeline(driver_desc), desc.layout->bind_group_layouts());
}

RenderPipeline Device::create_render_pipeline(const RenderPipelineDescriptor& desc) const {
    detail::validate_render_pipeline_descriptor(desc);

    driver::RenderPipelineDescriptor driver_desc;
    driver_desc.layout = &desc.layout->handle();
    driver_desc.vertex_module = &desc.vertex_module->handle();
    driver_desc.vertex_entry_point = desc.vertex_entry_point;
    driver_desc.vertex_buffer_layouts = desc.vertex_buffer_layouts;
    driver_desc.topology = desc.topology;
    driver_desc.strip_index_format = desc.strip_index_format;
    driver_desc.cull_mode = desc.cull_mode;
    driver_desc.fragment_module = desc.fragment_module != nullptr ? &desc.fragment_module->handle() : nullptr;
    driver_desc.fragment_entry_point = desc.fragment_entry_point;
    driver_desc.color_targets = desc.color_targets;
    driver_desc.depth_stencil = desc.depth_stencil;
    driver_desc.sample_count = desc.sample_count;
    driver_desc.constants = desc.constants;
    return RenderPipeline(device_->create_render_pipeline(driver_desc), desc.layout->bind_group_layouts(), desc);
}

// ============================================================================
// Encoding
// ============================================================================

CommandEncoder Device::create_command_encoder() const {
    return CommandEncoder(device_, device_->create_command_encoder());
}

RenderBundleEncoder<> Device::create_render_bundle_encoder(RenderTargetLayout layout) const {
    GPUBIND_ASSERT(!layout.color_formats.empty() || layout.depth_stencil_format.has_value(),
                   "render bundle layout needs a color or depth-stencil format");

    driver::RenderBundleEncoderDescriptor desc;
    desc.color_formats = layout.color_formats;
    desc.depth_stencil_format = layout.depth_stencil_format;
    desc.sample_count = layout.sample_count;
    return RenderBundleEncoder<>(detail::RenderBundleParts{device_->create_render_bundle_encoder(desc), {},
                                                           std::move(layout), {}});
}

}  // namespace gpubind::graphics
