// GpuBind Host Backend
// host_device.cpp - Host device, resource creation and map completion polling

#include "host_impl.hpp"

#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>

#include <array>

namespace gpubind::driver::host {

MappingMode parse_mapping_mode(std::string_view name) {
    if (name == "direct") {
        return MappingMode::Direct;
    }
    if (name == "staged") {
        return MappingMode::Staged;
    }
    GPUBIND_LOG_WARN(core::LogCategory::Driver, "Unknown mapping mode '{}', using direct", name);
    return MappingMode::Direct;
}

const char* to_string(MappingMode mode) {
    switch (mode) {
        case MappingMode::Direct:
            return "direct";
        case MappingMode::Staged:
            return "staged";
    }
    return "unknown";
}

// ============================================================================
// Context
// ============================================================================

void HostContext::enqueue_completion(std::function<void()> completion) {
    std::lock_guard lock(mutex);
    pending_completions.push_back(std::move(completion));
}

bool HostContext::is_lost() {
    std::lock_guard lock(mutex);
    return lost;
}

// ============================================================================
// Textures and Queries
// ============================================================================

std::shared_ptr<TextureView> HostTexture::create_view(const TextureViewDescriptor& desc) {
    GPUBIND_ASSERT(!destroyed_, "cannot create a view of destroyed texture '{}'", desc_.label);
    return std::make_shared<HostTextureView>(desc);
}

void HostQuerySet::set_result(uint32_t index, uint64_t value) {
    GPUBIND_ASSERT(index < results_.size(), "query index {} out of bounds", index);
    results_[index] = value;
}

uint64_t HostQuerySet::result(uint32_t index) const {
    GPUBIND_ASSERT(index < results_.size(), "query index {} out of bounds", index);
    return results_[index];
}

// ============================================================================
// Recorded Command Inspection
// ============================================================================

std::string_view command_name(const RecordedCommand& command) {
    static constexpr std::array<std::string_view, std::variant_size_v<RecordedCommand>> names = {
        "copy_buffer_to_buffer",
        "copy_buffer_to_texture",
        "copy_texture_to_buffer",
        "copy_texture_to_texture",
        "clear_buffer",
        "write_timestamp",
        "resolve_query_set",
        "begin_compute_pass",
        "end_compute_pass",
        "begin_render_pass",
        "end_render_pass",
        "set_compute_pipeline",
        "set_render_pipeline",
        "set_bind_group",
        "dispatch_workgroups",
        "dispatch_workgroups_indirect",
        "set_vertex_buffer",
        "set_index_buffer",
        "draw",
        "draw_indexed",
        "draw_indirect",
        "draw_indexed_indirect",
        "set_viewport",
        "set_scissor_rect",
        "set_blend_constant",
        "set_stencil_reference",
        "begin_occlusion_query",
        "end_occlusion_query",
        "execute_bundles",
    };
    return names[command.index()];
}

const std::vector<RecordedCommand>& recorded_commands(const CommandBuffer& command_buffer) {
    const auto* host_buffer = dynamic_cast<const HostCommandBuffer*>(&command_buffer);
    GPUBIND_ASSERT(host_buffer != nullptr, "command buffer was not recorded by the host backend");
    return host_buffer->commands();
}

const std::vector<RecordedCommand>& recorded_commands(const RenderBundle& bundle) {
    const auto* host_bundle = dynamic_cast<const HostRenderBundle*>(&bundle);
    GPUBIND_ASSERT(host_bundle != nullptr, "render bundle was not recorded by the host backend");
    return host_bundle->commands();
}

// ============================================================================
// Device
// ============================================================================

HostDevice::HostDevice(const HostDeviceOptions& options) : context_(std::make_shared<HostContext>()) {
    context_->mapping_mode = options.mapping_mode;
    context_->label = options.label;
    queue_ = std::make_unique<HostQueue>(context_);
    GPUBIND_LOG_DEBUG(core::LogCategory::Device, "Host device '{}' created with {} mapping", options.label,
                      to_string(options.mapping_mode));
}

HostDevice::~HostDevice() {
    // Requests still in flight resolve as aborted so no caller waits forever
    std::vector<std::function<void()>> completions;
    {
        std::lock_guard lock(context_->mutex);
        completions.swap(context_->pending_completions);
        context_->lost = true;
    }
    for (auto& completion : completions) {
        completion();
    }
}

std::shared_ptr<Buffer> HostDevice::create_buffer(const BufferDescriptor& desc) {
    GPUBIND_LOG_TRACE(core::LogCategory::Buffer, "Creating host buffer '{}' ({} bytes)", desc.label, desc.size);
    return std::make_shared<HostBuffer>(context_, desc);
}

std::shared_ptr<Texture> HostDevice::create_texture(const TextureDescriptor& desc) {
    GPUBIND_LOG_TRACE(core::LogCategory::Texture, "Creating host texture '{}' {}x{}x{} {}", desc.label,
                      desc.size.width, desc.size.height, desc.size.depth_or_layers, format::to_string(desc.format));
    return std::make_shared<HostTexture>(desc);
}

std::shared_ptr<Sampler> HostDevice::create_sampler(const SamplerDescriptor& desc) {
    return std::make_shared<HostSampler>(desc);
}

std::shared_ptr<BindGroupLayout> HostDevice::create_bind_group_layout(const BindGroupLayoutDescriptor& desc) {
    return std::make_shared<HostBindGroupLayout>(desc);
}

std::shared_ptr<PipelineLayout> HostDevice::create_pipeline_layout(const PipelineLayoutDescriptor& desc) {
    return std::make_shared<HostPipelineLayout>(desc.bind_group_layouts.size());
}

std::shared_ptr<BindGroup> HostDevice::create_bind_group(const BindGroupDescriptor& desc) {
    GPUBIND_ASSERT(desc.layout != nullptr, "bind group requires a layout");
    return std::make_shared<HostBindGroup>(desc.entries.size());
}

std::shared_ptr<QuerySet> HostDevice::create_query_set(const QuerySetDescriptor& desc) {
    GPUBIND_LOG_TRACE(core::LogCategory::Query, "Creating host query set with {} queries", desc.count);
    return std::make_shared<HostQuerySet>(desc);
}

std::shared_ptr<ShaderModule> HostDevice::create_shader_module(const ShaderModuleDescriptor& desc) {
    return std::make_shared<HostShaderModule>(desc.code);
}

std::shared_ptr<ComputePipeline> HostDevice::create_compute_pipeline(const ComputePipelineDescriptor& desc) {
    return std::make_shared<HostComputePipeline>(desc.entry_point);
}

std::shared_ptr<RenderPipeline> HostDevice::create_render_pipeline(const RenderPipelineDescriptor& desc) {
    return std::make_shared<HostRenderPipeline>(desc.vertex_entry_point);
}

std::unique_ptr<CommandEncoder> HostDevice::create_command_encoder() {
    return std::make_unique<HostCommandEncoder>();
}

std::unique_ptr<RenderBundleEncoder> HostDevice::create_render_bundle_encoder(
    const RenderBundleEncoderDescriptor& /*desc*/) {
    return std::make_unique<HostRenderBundleEncoder>();
}

Queue& HostDevice::queue() {
    return *queue_;
}

bool HostDevice::poll() {
    std::vector<std::function<void()>> completions;
    {
        std::lock_guard lock(context_->mutex);
        completions.swap(context_->pending_completions);
    }

    for (auto& completion : completions) {
        completion();
    }

    std::lock_guard lock(context_->mutex);
    return !context_->pending_completions.empty();
}

std::string_view HostDevice::backend_name() const {
    return BACKEND_NAME;
}

MappingMode HostDevice::mapping_mode() const {
    return context_->mapping_mode;
}

const std::string& HostDevice::label() const {
    return context_->label;
}

void HostDevice::simulate_device_loss() {
    GPUBIND_LOG_WARN(core::LogCategory::Device, "Host device '{}' lost", context_->label);
    std::lock_guard lock(context_->mutex);
    context_->lost = true;
}

bool HostDevice::is_lost() const {
    return context_->is_lost();
}

size_t HostDevice::submitted_command_buffer_count() const {
    std::lock_guard lock(context_->mutex);
    return context_->submitted_count;
}

std::shared_ptr<HostDevice> create_host_device(const HostDeviceOptions& options) {
    return std::make_shared<HostDevice>(options);
}

}  // namespace gpubind::driver::host
