// GpuBind Host Backend
// host_commands.cpp - Command recording and queue execution

#include "host_impl.hpp"

#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>

#include <cstring>

namespace gpubind::driver::host {

namespace {

HostBuffer& host_buffer(const Buffer* buffer) {
    // Queue writes go through the same object the encoder recorded
    auto* host = dynamic_cast<HostBuffer*>(const_cast<Buffer*>(buffer));
    GPUBIND_ASSERT(host != nullptr, "buffer was not created by the host backend");
    return *host;
}

HostQuerySet& host_query_set(const QuerySet* query_set) {
    auto* host = dynamic_cast<HostQuerySet*>(const_cast<QuerySet*>(query_set));
    GPUBIND_ASSERT(host != nullptr, "query set was not created by the host backend");
    return *host;
}

}  // namespace

// ============================================================================
// Compute Pass
// ============================================================================

HostComputePassEncoder::HostComputePassEncoder(std::vector<RecordedCommand>& commands, bool& pass_open)
    : commands_(commands), pass_open_(pass_open) {
    commands_.emplace_back(command::BeginComputePass{});
}

void HostComputePassEncoder::set_bind_group(uint32_t index, const BindGroup& bind_group) {
    commands_.emplace_back(command::SetBindGroup{index, &bind_group});
}

void HostComputePassEncoder::set_pipeline(const ComputePipeline& pipeline) {
    commands_.emplace_back(command::SetComputePipeline{&pipeline});
}

void HostComputePassEncoder::dispatch_workgroups(uint32_t x, uint32_t y, uint32_t z) {
    commands_.emplace_back(command::Dispatch{x, y, z});
}

void HostComputePassEncoder::dispatch_workgroups_indirect(const Buffer& buffer, size_t offset) {
    commands_.emplace_back(command::DispatchIndirect{&buffer, offset});
}

void HostComputePassEncoder::end() {
    GPUBIND_ASSERT(pass_open_, "compute pass ended twice");
    commands_.emplace_back(command::EndComputePass{});
    pass_open_ = false;
}

// ============================================================================
// Render Pass and Bundles
// ============================================================================

HostRenderPassEncoder::HostRenderPassEncoder(std::vector<RecordedCommand>& commands, bool& pass_open)
    : HostRenderEncoderBase(commands), pass_open_(pass_open) {}

void HostRenderPassEncoder::set_viewport(const Viewport& viewport) {
    record(command::SetViewport{viewport});
}

void HostRenderPassEncoder::set_scissor_rect(const ScissorRect& scissor_rect) {
    record(command::SetScissorRect{scissor_rect});
}

void HostRenderPassEncoder::set_blend_constant(const BlendConstant& blend_constant) {
    record(command::SetBlendConstant{blend_constant});
}

void HostRenderPassEncoder::set_stencil_reference(uint32_t reference) {
    record(command::SetStencilReference{reference});
}

void HostRenderPassEncoder::begin_occlusion_query(uint32_t query_index) {
    record(command::BeginOcclusionQuery{query_index});
}

void HostRenderPassEncoder::end_occlusion_query() {
    record(command::EndOcclusionQuery{});
}

void HostRenderPassEncoder::execute_bundles(std::span<const RenderBundle* const> bundles) {
    record(command::ExecuteBundles{{bundles.begin(), bundles.end()}});
}

void HostRenderPassEncoder::end() {
    GPUBIND_ASSERT(pass_open_, "render pass ended twice");
    record(command::EndRenderPass{});
    pass_open_ = false;
}

HostRenderBundleEncoder::HostRenderBundleEncoder() : HostRenderEncoderBase(bundle_commands_) {}

std::shared_ptr<RenderBundle> HostRenderBundleEncoder::finish() {
    return std::make_shared<HostRenderBundle>(std::move(bundle_commands_));
}

// ============================================================================
// Command Encoder
// ============================================================================

void HostCommandEncoder::record(RecordedCommand command) {
    GPUBIND_ASSERT(!finished_, "command encoder already finished");
    GPUBIND_ASSERT(!pass_open_, "cannot encode {} while a pass is open", command_name(command));
    commands_.push_back(std::move(command));
}

void HostCommandEncoder::copy_buffer_to_buffer(const CopyBufferToBuffer& op) {
    record(op);
}

void HostCommandEncoder::copy_buffer_to_texture(const CopyBufferToTexture& op) {
    record(op);
}

void HostCommandEncoder::copy_texture_to_buffer(const CopyTextureToBuffer& op) {
    record(op);
}

void HostCommandEncoder::copy_texture_to_texture(const CopyTextureToTexture& op) {
    record(op);
}

void HostCommandEncoder::clear_buffer(const ClearBuffer& op) {
    record(op);
}

std::unique_ptr<ComputePassEncoder> HostCommandEncoder::begin_compute_pass() {
    GPUBIND_ASSERT(!finished_ && !pass_open_, "cannot begin a compute pass here");
    pass_open_ = true;
    return std::make_unique<HostComputePassEncoder>(commands_, pass_open_);
}

std::unique_ptr<RenderPassEncoder> HostCommandEncoder::begin_render_pass(const RenderPassDescriptor& desc) {
    record(command::BeginRenderPass{desc});
    pass_open_ = true;
    return std::make_unique<HostRenderPassEncoder>(commands_, pass_open_);
}

void HostCommandEncoder::write_timestamp(const QuerySet& query_set, uint32_t index) {
    record(command::WriteTimestamp{&query_set, index});
}

void HostCommandEncoder::resolve_query_set(const ResolveQuerySet& op) {
    record(op);
}

std::shared_ptr<CommandBuffer> HostCommandEncoder::finish() {
    GPUBIND_ASSERT(!finished_, "command encoder already finished");
    GPUBIND_ASSERT(!pass_open_, "cannot finish while a pass is open");
    finished_ = true;
    return std::make_shared<HostCommandBuffer>(std::move(commands_));
}

// ============================================================================
// Queue
// ============================================================================

void HostQueue::submit(const CommandBuffer& command_buffer) {
    const auto& commands = recorded_commands(command_buffer);
    GPUBIND_LOG_TRACE(core::LogCategory::Command, "Submitting {} host commands", commands.size());
    for (const auto& command : commands) {
        execute(command);
    }
    std::lock_guard lock(context_->mutex);
    ++context_->submitted_count;
}

void HostQueue::execute(const RecordedCommand& command) {
    if (const auto* copy = std::get_if<CopyBufferToBuffer>(&command)) {
        auto& destination = host_buffer(copy->destination);
        const auto& source = host_buffer(copy->source);
        if (source.is_mapped() || destination.is_mapped()) {
            GPUBIND_LOG_ERROR(core::LogCategory::Command, "Skipping copy that uses a mapped buffer");
            return;
        }
        destination.copy_from(source, copy->source_offset, copy->destination_offset, copy->size);
    } else if (const auto* clear = std::get_if<ClearBuffer>(&command)) {
        auto& buffer = host_buffer(clear->buffer);
        if (buffer.is_mapped()) {
            GPUBIND_LOG_ERROR(core::LogCategory::Command, "Skipping clear of a mapped buffer");
            return;
        }
        buffer.fill_zero(clear->offset, clear->size);
    } else if (const auto* timestamp = std::get_if<command::WriteTimestamp>(&command)) {
        uint64_t tick = 0;
        {
            std::lock_guard lock(context_->mutex);
            tick = context_->next_timestamp++;
        }
        host_query_set(timestamp->query_set).set_result(timestamp->index, tick);
    } else if (const auto* resolve = std::get_if<ResolveQuerySet>(&command)) {
        const auto& query_set = host_query_set(resolve->query_set);
        auto& destination = host_buffer(resolve->destination);
        if (destination.is_mapped()) {
            GPUBIND_LOG_ERROR(core::LogCategory::Query, "Skipping resolve into a mapped buffer");
            return;
        }
        std::vector<uint64_t> values(resolve->query_count);
        for (uint32_t i = 0; i < resolve->query_count; ++i) {
            values[i] = query_set.result(resolve->first_query + i);
        }
        destination.write(resolve->destination_offset, std::as_bytes(std::span<const uint64_t>(values)));
    } else if (const auto* begin_pass = std::get_if<command::BeginRenderPass>(&command)) {
        // No fragments are rasterized on the host, every occlusion query passes zero samples
        if (begin_pass->descriptor.occlusion_query_set != nullptr) {
            auto& query_set = host_query_set(begin_pass->descriptor.occlusion_query_set);
            for (uint32_t i = 0; i < query_set.count(); ++i) {
                query_set.set_result(i, 0);
            }
        }
    }
}

void HostQueue::write_buffer(const WriteBufferOperation& op) {
    auto& buffer = host_buffer(op.buffer);
    if (buffer.is_mapped()) {
        GPUBIND_LOG_ERROR(core::LogCategory::Buffer, "Skipping queue write into a mapped buffer");
        return;
    }
    GPUBIND_ASSERT(op.offset + op.data.size() <= buffer.size(), "queue write of {} bytes at {} overruns buffer",
                   op.data.size(), op.offset);
    buffer.write(op.offset, op.data);
}

void HostQueue::write_texture(const WriteTextureOperation& op) {
    GPUBIND_LOG_TRACE(core::LogCategory::Texture, "Host texture write of {} bytes ({}x{}x{})", op.data.size(),
                      op.size.width, op.size.height, op.size.depth_or_layers);
}

}  // namespace gpubind::driver::host
