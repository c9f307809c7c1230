// GpuBind Graphics Layer
// device.hpp - Typed resource creation on top of a driver device

#pragma once

#include "bind_group.hpp"
#include "buffer.hpp"
#include "command_encoder.hpp"
#include "pipeline.hpp"
#include "query_set.hpp"
#include "queue.hpp"
#include "render_bundle.hpp"
#include "sampler.hpp"
#include "texture.hpp"

#include <gpubind/driver/driver.hpp>

#include <memory>
#include <span>
#include <vector>

namespace gpubind::core {
class Config;
}

namespace gpubind::graphics {

using driver::DeviceDescriptor;

class Device {
public:
    explicit Device(std::shared_ptr<driver::Device> device);

    Device(Device&&) noexcept = default;
    Device& operator=(Device&&) noexcept = default;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    // Throws std::runtime_error when the backend is not registered
    [[nodiscard]] static Device create(const DeviceDescriptor& desc = {});
    [[nodiscard]] static Device from_config(const core::Config& config);

    [[nodiscard]] driver::Device& handle() const { return *device_; }
    [[nodiscard]] const std::shared_ptr<driver::Device>& handle_ptr() const { return device_; }
    [[nodiscard]] std::string_view backend_name() const { return device_->backend_name(); }

    // ========================================================================
    // Buffers
    // ========================================================================

    // Copies value into a new buffer, left mapped for writing when stay_mapped is set
    template<BufferUsage U, BufferData T>
    [[nodiscard]] Buffer<T, U> create_buffer(const T& value, bool stay_mapped = false) const {
        return Buffer<T, U>(create_buffer_init(std::as_bytes(std::span<const T, 1>(&value, 1)), U, stay_mapped));
    }

    template<BufferUsage U, BufferData T>
    [[nodiscard]] Buffer<T[], U> create_slice_buffer(std::span<const T> data, bool stay_mapped = false) const {
        return Buffer<T[], U>(create_buffer_init(std::as_bytes(data), U, stay_mapped));
    }

    // Contents must be written before assume_init allows reading them
    template<BufferUsage U, BufferData T>
    [[nodiscard]] Buffer<Uninit<T>, U> create_buffer_uninit(bool mapped_at_creation = false) const {
        return Buffer<Uninit<T>, U>(create_buffer_resource(sizeof(T), U, mapped_at_creation));
    }

    template<BufferUsage U, BufferData T>
    [[nodiscard]] Buffer<Uninit<T>[], U> create_slice_buffer_uninit(size_t len, bool mapped_at_creation = false) const {
        return Buffer<Uninit<T>[], U>(create_buffer_resource(len * sizeof(T), U, mapped_at_creation));
    }

    // ========================================================================
    // Textures, Samplers and Queries
    // ========================================================================

    [[nodiscard]] Texture create_texture(const TextureDescriptor& desc) const;
    [[nodiscard]] Sampler create_sampler(const driver::SamplerDescriptor& desc = {}) const;
    [[nodiscard]] OcclusionQuerySet create_occlusion_query_set(uint32_t len) const;
    [[nodiscard]] TimestampQuerySet create_timestamp_query_set(uint32_t len) const;

    // ========================================================================
    // Binding and Pipelines
    // ========================================================================

    [[nodiscard]] BindGroupLayout create_bind_group_layout(std::vector<driver::BindGroupLayoutEntry> entries) const;
    [[nodiscard]] PipelineLayout create_pipeline_layout(std::vector<BindGroupLayout> bind_group_layouts) const;
    [[nodiscard]] BindGroup create_bind_group(const BindGroupLayout& layout,
                                              const std::vector<BindGroupEntry>& entries) const;
    [[nodiscard]] ShaderModule create_shader_module(const driver::ShaderModuleDescriptor& desc) const;
    [[nodiscard]] ComputePipeline create_compute_pipeline(const ComputePipelineDescriptor& desc) const;
    [[nodiscard]] RenderPipeline create_render_pipeline(const RenderPipelineDescriptor& desc) const;

    // ========================================================================
    // Encoding and Submission
    // ========================================================================

    [[nodiscard]] CommandEncoder create_command_encoder() const;
    [[nodiscard]] RenderBundleEncoder<> create_render_bundle_encoder(RenderTargetLayout layout) const;

    [[nodiscard]] const Queue& queue() const { return queue_; }

    // Runs callbacks of resolved map requests, returns true while requests are outstanding
    bool poll() const { return device_->poll(); }

private:
    [[nodiscard]] std::shared_ptr<detail::BufferResource> create_buffer_resource(size_t size, BufferUsage usage,
                                                                                 bool mapped_at_creation) const;
    [[nodiscard]] std::shared_ptr<detail::BufferResource> create_buffer_init(std::span<const std::byte> data,
                                                                             BufferUsage usage,
                                                                             bool stay_mapped) const;

    std::shared_ptr<driver::Device> device_;
    Queue queue_;
};

}  // namespace gpubind::graphics
