// GpuBind Driver Contract
// driver.hpp - Abstract interface every backend implements

#pragma once

#include "types.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace gpubind::core {
class Config;
}

namespace gpubind::driver {

// ============================================================================
// Resources
// ============================================================================

// Host access to a mapped byte range. Staging backends copy the bytes out and
// write mutable ranges back on flush().
class MappedRange {
public:
    virtual ~MappedRange() = default;

    MappedRange(const MappedRange&) = delete;
    MappedRange& operator=(const MappedRange&) = delete;

    [[nodiscard]] virtual std::span<const std::byte> bytes() const = 0;
    [[nodiscard]] virtual std::span<std::byte> bytes_mut() = 0;
    virtual void flush() = 0;

protected:
    MappedRange() = default;
};

class Buffer {
public:
    virtual ~Buffer() = default;

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    using MapCallback = std::function<void(MapStatus)>;

    [[nodiscard]] virtual size_t size() const = 0;
    [[nodiscard]] virtual BufferUsage usage() const = 0;

    // The callback runs from Device::poll() once the request resolves
    virtual void map_async(MapMode mode, size_t offset, size_t size, MapCallback callback) = 0;
    [[nodiscard]] virtual std::unique_ptr<MappedRange> mapped_range(size_t offset, size_t size, bool writable) = 0;
    virtual void unmap() = 0;

    // Releases GPU memory early; pending and future map requests fail
    virtual void destroy() = 0;

protected:
    Buffer() = default;
};

class TextureView {
public:
    virtual ~TextureView() = default;

    TextureView(const TextureView&) = delete;
    TextureView& operator=(const TextureView&) = delete;

protected:
    TextureView() = default;
};

class Texture {
public:
    virtual ~Texture() = default;

    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    [[nodiscard]] virtual std::shared_ptr<TextureView> create_view(const TextureViewDescriptor& desc) = 0;
    virtual void destroy() = 0;

protected:
    Texture() = default;
};

// Opaque handles, backends derive from these
#define GPUBIND_DRIVER_HANDLE(Name)              \
    class Name {                                 \
    public:                                      \
        virtual ~Name() = default;               \
        Name(const Name&) = delete;              \
        Name& operator=(const Name&) = delete;   \
                                                 \
    protected:                                   \
        Name() = default;                        \
    }

GPUBIND_DRIVER_HANDLE(Sampler);
GPUBIND_DRIVER_HANDLE(BindGroupLayout);
GPUBIND_DRIVER_HANDLE(PipelineLayout);
GPUBIND_DRIVER_HANDLE(BindGroup);
GPUBIND_DRIVER_HANDLE(ShaderModule);
GPUBIND_DRIVER_HANDLE(ComputePipeline);
GPUBIND_DRIVER_HANDLE(RenderPipeline);
GPUBIND_DRIVER_HANDLE(RenderBundle);
GPUBIND_DRIVER_HANDLE(CommandBuffer);

#undef GPUBIND_DRIVER_HANDLE

class QuerySet {
public:
    virtual ~QuerySet() = default;

    QuerySet(const QuerySet&) = delete;
    QuerySet& operator=(const QuerySet&) = delete;

    [[nodiscard]] virtual QueryType type() const = 0;
    [[nodiscard]] virtual uint32_t count() const = 0;

protected:
    QuerySet() = default;
};

// ============================================================================
// Pass Encoders
// ============================================================================

class ProgrammablePassEncoder {
public:
    virtual ~ProgrammablePassEncoder() = default;

    ProgrammablePassEncoder(const ProgrammablePassEncoder&) = delete;
    ProgrammablePassEncoder& operator=(const ProgrammablePassEncoder&) = delete;

    virtual void set_bind_group(uint32_t index, const BindGroup& bind_group) = 0;

protected:
    ProgrammablePassEncoder() = default;
};

class ComputePassEncoder : public ProgrammablePassEncoder {
public:
    virtual void set_pipeline(const ComputePipeline& pipeline) = 0;
    virtual void dispatch_workgroups(uint32_t x, uint32_t y, uint32_t z) = 0;
    virtual void dispatch_workgroups_indirect(const Buffer& buffer, size_t offset) = 0;
    virtual void end() = 0;
};

// Commands shared by render passes and render bundles
class RenderEncoder : public ProgrammablePassEncoder {
public:
    virtual void set_pipeline(const RenderPipeline& pipeline) = 0;
    virtual void set_index_buffer(const SetIndexBuffer& op) = 0;
    virtual void set_vertex_buffer(const SetVertexBuffer& op) = 0;
    virtual void draw(const Draw& op) = 0;
    virtual void draw_indexed(const DrawIndexed& op) = 0;
    virtual void draw_indirect(const Buffer& buffer, size_t offset) = 0;
    virtual void draw_indexed_indirect(const Buffer& buffer, size_t offset) = 0;
};

class RenderPassEncoder : public RenderEncoder {
public:
    virtual void set_viewport(const Viewport& viewport) = 0;
    virtual void set_scissor_rect(const ScissorRect& scissor_rect) = 0;
    virtual void set_blend_constant(const BlendConstant& blend_constant) = 0;
    virtual void set_stencil_reference(uint32_t reference) = 0;
    virtual void begin_occlusion_query(uint32_t query_index) = 0;
    virtual void end_occlusion_query() = 0;
    virtual void execute_bundles(std::span<const RenderBundle* const> bundles) = 0;
    virtual void end() = 0;
};

class RenderBundleEncoder : public RenderEncoder {
public:
    [[nodiscard]] virtual std::shared_ptr<RenderBundle> finish() = 0;
};

// ============================================================================
// Command Encoding and Submission
// ============================================================================

class CommandEncoder {
public:
    virtual ~CommandEncoder() = default;

    CommandEncoder(const CommandEncoder&) = delete;
    CommandEncoder& operator=(const CommandEncoder&) = delete;

    virtual void copy_buffer_to_buffer(const CopyBufferToBuffer& op) = 0;
    virtual void copy_buffer_to_texture(const CopyBufferToTexture& op) = 0;
    virtual void copy_texture_to_buffer(const CopyTextureToBuffer& op) = 0;
    virtual void copy_texture_to_texture(const CopyTextureToTexture& op) = 0;
    virtual void clear_buffer(const ClearBuffer& op) = 0;

    // The pass encoder must be ended before the next command is encoded
    [[nodiscard]] virtual std::unique_ptr<ComputePassEncoder> begin_compute_pass() = 0;
    [[nodiscard]] virtual std::unique_ptr<RenderPassEncoder> begin_render_pass(const RenderPassDescriptor& desc) = 0;

    virtual void write_timestamp(const QuerySet& query_set, uint32_t index) = 0;
    virtual void resolve_query_set(const ResolveQuerySet& op) = 0;

    [[nodiscard]] virtual std::shared_ptr<CommandBuffer> finish() = 0;

protected:
    CommandEncoder() = default;
};

class Queue {
public:
    virtual ~Queue() = default;

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    virtual void submit(const CommandBuffer& command_buffer) = 0;
    virtual void write_buffer(const WriteBufferOperation& op) = 0;
    virtual void write_texture(const WriteTextureOperation& op) = 0;

protected:
    Queue() = default;
};

// ============================================================================
// Device
// ============================================================================

class Device {
public:
    virtual ~Device() = default;

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] virtual std::shared_ptr<Buffer> create_buffer(const BufferDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<Texture> create_texture(const TextureDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<Sampler> create_sampler(const SamplerDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<BindGroupLayout> create_bind_group_layout(
        const BindGroupLayoutDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<PipelineLayout> create_pipeline_layout(
        const PipelineLayoutDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<BindGroup> create_bind_group(const BindGroupDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<QuerySet> create_query_set(const QuerySetDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<ShaderModule> create_shader_module(const ShaderModuleDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<ComputePipeline> create_compute_pipeline(
        const ComputePipelineDescriptor& desc) = 0;
    [[nodiscard]] virtual std::shared_ptr<RenderPipeline> create_render_pipeline(
        const RenderPipelineDescriptor& desc) = 0;
    [[nodiscard]] virtual std::unique_ptr<CommandEncoder> create_command_encoder() = 0;
    [[nodiscard]] virtual std::unique_ptr<RenderBundleEncoder> create_render_bundle_encoder(
        const RenderBundleEncoderDescriptor& desc) = 0;

    [[nodiscard]] virtual Queue& queue() = 0;

    // Runs completion callbacks of resolved map requests. Returns true while
    // requests are still outstanding.
    virtual bool poll() = 0;

    [[nodiscard]] virtual std::string_view backend_name() const = 0;

protected:
    Device() = default;
};

// ============================================================================
// Backend Selection
// ============================================================================

using DeviceFactory = std::function<std::shared_ptr<Device>(const DeviceDescriptor&)>;

// Makes an out-of-tree backend available to create_device under the given name
void register_backend(std::string name, DeviceFactory factory);
[[nodiscard]] bool has_backend(std::string_view name);

// Throws std::runtime_error for unknown backend names
[[nodiscard]] std::shared_ptr<Device> create_device(const DeviceDescriptor& desc);

[[nodiscard]] DeviceDescriptor device_descriptor_from_config(const core::Config& config);

}  // namespace gpubind::driver
