// GpuBind Host Backend
// host_impl.hpp - Host backend object definitions

#pragma once

#include <gpubind/driver/host_driver.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

namespace gpubind::driver::host {

// State shared by the device and every object it creates
struct HostContext {
    MappingMode mapping_mode = MappingMode::Direct;
    std::string label;

    std::mutex mutex;
    bool lost = false;
    std::vector<std::function<void()>> pending_completions;
    uint64_t next_timestamp = 1;
    size_t submitted_count = 0;

    void enqueue_completion(std::function<void()> completion);
    [[nodiscard]] bool is_lost();
};

// ============================================================================
// Buffers
// ============================================================================

class HostBuffer final : public Buffer, public std::enable_shared_from_this<HostBuffer> {
public:
    HostBuffer(std::shared_ptr<HostContext> context, const BufferDescriptor& desc);

    [[nodiscard]] size_t size() const override { return storage_.size(); }
    [[nodiscard]] BufferUsage usage() const override { return usage_; }

    void map_async(MapMode mode, size_t offset, size_t size, MapCallback callback) override;
    [[nodiscard]] std::unique_ptr<MappedRange> mapped_range(size_t offset, size_t size, bool writable) override;
    void unmap() override;
    void destroy() override;

    [[nodiscard]] bool is_mapped() const;

    // Queue-side access, the caller has validated the range
    void write(size_t offset, std::span<const std::byte> data);
    void copy_from(const HostBuffer& source, size_t source_offset, size_t offset, size_t size);
    void fill_zero(size_t offset, size_t size);
    [[nodiscard]] std::vector<std::byte> read(size_t offset, size_t size) const;

    void write_back(size_t offset, std::span<const std::byte> data);

private:
    enum class MapState : uint8_t {
        Unmapped,
        Pending,
        Mapped,
    };

    void complete_map(uint64_t serial, MapCallback& callback);

    std::shared_ptr<HostContext> context_;
    BufferUsage usage_;
    std::string label_;

    mutable std::mutex mutex_;
    std::vector<std::byte> storage_;
    MapState state_ = MapState::Unmapped;
    bool writable_mapping_ = false;
    size_t map_offset_ = 0;
    size_t map_size_ = 0;
    uint64_t map_serial_ = 0;
    bool destroyed_ = false;
};

// ============================================================================
// Textures, Samplers, Queries
// ============================================================================

class HostTextureView final : public TextureView {
public:
    explicit HostTextureView(const TextureViewDescriptor& desc) : desc_(desc) {}

    [[nodiscard]] const TextureViewDescriptor& descriptor() const { return desc_; }

private:
    TextureViewDescriptor desc_;
};

class HostTexture final : public Texture {
public:
    explicit HostTexture(const TextureDescriptor& desc) : desc_(desc) {}

    [[nodiscard]] std::shared_ptr<TextureView> create_view(const TextureViewDescriptor& desc) override;
    void destroy() override { destroyed_ = true; }

    [[nodiscard]] const TextureDescriptor& descriptor() const { return desc_; }

private:
    TextureDescriptor desc_;
    bool destroyed_ = false;
};

class HostSampler final : public Sampler {
public:
    explicit HostSampler(const SamplerDescriptor& desc) : desc_(desc) {}

private:
    SamplerDescriptor desc_;
};

class HostQuerySet final : public QuerySet {
public:
    explicit HostQuerySet(const QuerySetDescriptor& desc) : desc_(desc), results_(desc.count, 0) {}

    [[nodiscard]] QueryType type() const override { return desc_.type; }
    [[nodiscard]] uint32_t count() const override { return desc_.count; }

    void set_result(uint32_t index, uint64_t value);
    [[nodiscard]] uint64_t result(uint32_t index) const;

private:
    QuerySetDescriptor desc_;
    std::vector<uint64_t> results_;
};

// ============================================================================
// Binding and Pipelines
// ============================================================================

class HostBindGroupLayout final : public BindGroupLayout {
public:
    explicit HostBindGroupLayout(const BindGroupLayoutDescriptor& desc) : desc_(desc) {}

private:
    BindGroupLayoutDescriptor desc_;
};

class HostPipelineLayout final : public PipelineLayout {
public:
    explicit HostPipelineLayout(size_t bind_group_count) : bind_group_count_(bind_group_count) {}

private:
    size_t bind_group_count_;
};

class HostBindGroup final : public BindGroup {
public:
    explicit HostBindGroup(size_t entry_count) : entry_count_(entry_count) {}

private:
    size_t entry_count_;
};

class HostShaderModule final : public ShaderModule {
public:
    explicit HostShaderModule(std::string code) : code_(std::move(code)) {}

private:
    std::string code_;
};

class HostComputePipeline final : public ComputePipeline {
public:
    explicit HostComputePipeline(std::string entry_point) : entry_point_(std::move(entry_point)) {}

private:
    std::string entry_point_;
};

class HostRenderPipeline final : public RenderPipeline {
public:
    explicit HostRenderPipeline(std::string entry_point) : entry_point_(std::move(entry_point)) {}

private:
    std::string entry_point_;
};

// ============================================================================
// Command Recording
// ============================================================================

class HostCommandBuffer final : public CommandBuffer {
public:
    explicit HostCommandBuffer(std::vector<RecordedCommand> commands) : commands_(std::move(commands)) {}

    [[nodiscard]] const std::vector<RecordedCommand>& commands() const { return commands_; }

private:
    std::vector<RecordedCommand> commands_;
};

class HostRenderBundle final : public RenderBundle {
public:
    explicit HostRenderBundle(std::vector<RecordedCommand> commands) : commands_(std::move(commands)) {}

    [[nodiscard]] const std::vector<RecordedCommand>& commands() const { return commands_; }

private:
    std::vector<RecordedCommand> commands_;
};

class HostComputePassEncoder final : public ComputePassEncoder {
public:
    HostComputePassEncoder(std::vector<RecordedCommand>& commands, bool& pass_open);

    void set_bind_group(uint32_t index, const BindGroup& bind_group) override;
    void set_pipeline(const ComputePipeline& pipeline) override;
    void dispatch_workgroups(uint32_t x, uint32_t y, uint32_t z) override;
    void dispatch_workgroups_indirect(const Buffer& buffer, size_t offset) override;
    void end() override;

private:
    std::vector<RecordedCommand>& commands_;
    bool& pass_open_;
};

// Shared recording for render passes and render bundles
template<typename Base>
class HostRenderEncoderBase : public Base {
public:
    void set_bind_group(uint32_t index, const BindGroup& bind_group) override {
        record(command::SetBindGroup{index, &bind_group});
    }

    void set_pipeline(const RenderPipeline& pipeline) override { record(command::SetRenderPipeline{&pipeline}); }
    void set_index_buffer(const SetIndexBuffer& op) override { record(op); }
    void set_vertex_buffer(const SetVertexBuffer& op) override { record(op); }
    void draw(const Draw& op) override { record(op); }
    void draw_indexed(const DrawIndexed& op) override { record(op); }

    void draw_indirect(const Buffer& buffer, size_t offset) override {
        record(command::DrawIndirect{&buffer, offset});
    }

    void draw_indexed_indirect(const Buffer& buffer, size_t offset) override {
        record(command::DrawIndexedIndirect{&buffer, offset});
    }

protected:
    explicit HostRenderEncoderBase(std::vector<RecordedCommand>& commands) : commands_(commands) {}

    void record(RecordedCommand command) { commands_.push_back(std::move(command)); }

    std::vector<RecordedCommand>& commands_;
};

class HostRenderPassEncoder final : public HostRenderEncoderBase<RenderPassEncoder> {
public:
    HostRenderPassEncoder(std::vector<RecordedCommand>& commands, bool& pass_open);

    void set_viewport(const Viewport& viewport) override;
    void set_scissor_rect(const ScissorRect& scissor_rect) override;
    void set_blend_constant(const BlendConstant& blend_constant) override;
    void set_stencil_reference(uint32_t reference) override;
    void begin_occlusion_query(uint32_t query_index) override;
    void end_occlusion_query() override;
    void execute_bundles(std::span<const RenderBundle* const> bundles) override;
    void end() override;

private:
    bool& pass_open_;
};

class HostRenderBundleEncoder final : public HostRenderEncoderBase<RenderBundleEncoder> {
public:
    HostRenderBundleEncoder();

    [[nodiscard]] std::shared_ptr<RenderBundle> finish() override;

private:
    std::vector<RecordedCommand> bundle_commands_;
};

class HostCommandEncoder final : public CommandEncoder {
public:
    void copy_buffer_to_buffer(const CopyBufferToBuffer& op) override;
    void copy_buffer_to_texture(const CopyBufferToTexture& op) override;
    void copy_texture_to_buffer(const CopyTextureToBuffer& op) override;
    void copy_texture_to_texture(const CopyTextureToTexture& op) override;
    void clear_buffer(const ClearBuffer& op) override;

    [[nodiscard]] std::unique_ptr<ComputePassEncoder> begin_compute_pass() override;
    [[nodiscard]] std::unique_ptr<RenderPassEncoder> begin_render_pass(const RenderPassDescriptor& desc) override;

    void write_timestamp(const QuerySet& query_set, uint32_t index) override;
    void resolve_query_set(const ResolveQuerySet& op) override;

    [[nodiscard]] std::shared_ptr<CommandBuffer> finish() override;

private:
    void record(RecordedCommand command);

    std::vector<RecordedCommand> commands_;
    bool pass_open_ = false;
    bool finished_ = false;
};

class HostQueue final : public Queue {
public:
    explicit HostQueue(std::shared_ptr<HostContext> context) : context_(std::move(context)) {}

    void submit(const CommandBuffer& command_buffer) override;
    void write_buffer(const WriteBufferOperation& op) override;
    void write_texture(const WriteTextureOperation& op) override;

private:
    void execute(const RecordedCommand& command);

    std::shared_ptr<HostContext> context_;
};

}  // namespace gpubind::driver::host
