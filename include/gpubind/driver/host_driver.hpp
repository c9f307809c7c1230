// GpuBind Driver Contract
// host_driver.hpp - In-process reference backend
//
// The host backend keeps buffer memory in host RAM, records every encoded
// command for inspection and executes transfer commands on submit. Its two
// mapping modes mirror the two driver families: Direct hands out ranges that
// alias the buffer memory, Staged hands out copies that are written back when
// a mutable range is flushed.

#pragma once

#include "driver.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gpubind::driver::host {

inline constexpr std::string_view BACKEND_NAME = "host";

enum class MappingMode : uint8_t {
    Direct,
    Staged,
};

// "direct" or "staged", anything else falls back to Direct with a warning
[[nodiscard]] MappingMode parse_mapping_mode(std::string_view name);
[[nodiscard]] const char* to_string(MappingMode mode);

struct HostDeviceOptions {
    MappingMode mapping_mode = MappingMode::Direct;
    std::string label = "host";
};

// ============================================================================
// Recorded Commands
// ============================================================================

namespace command {

struct WriteTimestamp {
    const QuerySet* query_set = nullptr;
    uint32_t index = 0;
};

struct BeginComputePass {};
struct EndComputePass {};

struct BeginRenderPass {
    RenderPassDescriptor descriptor;
};

struct EndRenderPass {};

struct SetComputePipeline {
    const ComputePipeline* pipeline = nullptr;
};

struct SetRenderPipeline {
    const RenderPipeline* pipeline = nullptr;
};

struct SetBindGroup {
    uint32_t index = 0;
    const BindGroup* bind_group = nullptr;
};

struct Dispatch {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t z = 0;
};

struct DispatchIndirect {
    const Buffer* buffer = nullptr;
    size_t offset = 0;
};

struct DrawIndirect {
    const Buffer* buffer = nullptr;
    size_t offset = 0;
};

struct DrawIndexedIndirect {
    const Buffer* buffer = nullptr;
    size_t offset = 0;
};

struct SetViewport {
    Viewport viewport;
};

struct SetScissorRect {
    ScissorRect rect;
};

struct SetBlendConstant {
    BlendConstant color;
};

struct SetStencilReference {
    uint32_t reference = 0;
};

struct BeginOcclusionQuery {
    uint32_t query_index = 0;
};

struct EndOcclusionQuery {};

struct ExecuteBundles {
    std::vector<const RenderBundle*> bundles;
};

}  // namespace command

using RecordedCommand = std::variant<CopyBufferToBuffer,
                                     CopyBufferToTexture,
                                     CopyTextureToBuffer,
                                     CopyTextureToTexture,
                                     ClearBuffer,
                                     command::WriteTimestamp,
                                     ResolveQuerySet,
                                     command::BeginComputePass,
                                     command::EndComputePass,
                                     command::BeginRenderPass,
                                     command::EndRenderPass,
                                     command::SetComputePipeline,
                                     command::SetRenderPipeline,
                                     command::SetBindGroup,
                                     command::Dispatch,
                                     command::DispatchIndirect,
                                     SetVertexBuffer,
                                     SetIndexBuffer,
                                     Draw,
                                     DrawIndexed,
                                     command::DrawIndirect,
                                     command::DrawIndexedIndirect,
                                     command::SetViewport,
                                     command::SetScissorRect,
                                     command::SetBlendConstant,
                                     command::SetStencilReference,
                                     command::BeginOcclusionQuery,
                                     command::EndOcclusionQuery,
                                     command::ExecuteBundles>;

[[nodiscard]] std::string_view command_name(const RecordedCommand& command);

// Commands recorded into a finished host command buffer or render bundle
[[nodiscard]] const std::vector<RecordedCommand>& recorded_commands(const CommandBuffer& command_buffer);
[[nodiscard]] const std::vector<RecordedCommand>& recorded_commands(const RenderBundle& bundle);

// ============================================================================
// Host Device
// ============================================================================

struct HostContext;
class HostQueue;

class HostDevice final : public Device {
public:
    explicit HostDevice(const HostDeviceOptions& options);
    ~HostDevice() override;

    [[nodiscard]] std::shared_ptr<Buffer> create_buffer(const BufferDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<Texture> create_texture(const TextureDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<Sampler> create_sampler(const SamplerDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<BindGroupLayout> create_bind_group_layout(
        const BindGroupLayoutDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<PipelineLayout> create_pipeline_layout(const PipelineLayoutDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<BindGroup> create_bind_group(const BindGroupDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<QuerySet> create_query_set(const QuerySetDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<ShaderModule> create_shader_module(const ShaderModuleDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<ComputePipeline> create_compute_pipeline(
        const ComputePipelineDescriptor& desc) override;
    [[nodiscard]] std::shared_ptr<RenderPipeline> create_render_pipeline(const RenderPipelineDescriptor& desc) override;
    [[nodiscard]] std::unique_ptr<CommandEncoder> create_command_encoder() override;
    [[nodiscard]] std::unique_ptr<RenderBundleEncoder> create_render_bundle_encoder(
        const RenderBundleEncoderDescriptor& desc) override;

    [[nodiscard]] Queue& queue() override;
    bool poll() override;
    [[nodiscard]] std::string_view backend_name() const override;

    [[nodiscard]] MappingMode mapping_mode() const;
    [[nodiscard]] const std::string& label() const;

    // Every map request from here on fails with MapStatus::DeviceLost
    void simulate_device_loss();
    [[nodiscard]] bool is_lost() const;

    [[nodiscard]] size_t submitted_command_buffer_count() const;

private:
    std::shared_ptr<HostContext> context_;
    std::unique_ptr<HostQueue> queue_;
};

[[nodiscard]] std::shared_ptr<HostDevice> create_host_device(const HostDeviceOptions& options = {});

}  // namespace gpubind::driver::host
