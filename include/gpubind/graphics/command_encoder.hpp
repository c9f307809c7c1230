// GpuBind Graphics Layer
// command_encoder.hpp - Top-level command encoder and command buffers
//
// The encoder is a consuming builder: every call takes the encoder as an
// rvalue and returns it, so commands are recorded in call order. Everything a
// command references is retained until the finished command buffer is
// dropped.

#pragma once

#include "encoder_state.hpp"
#include "query_set.hpp"
#include "render_target.hpp"
#include "texture.hpp"
#include "view.hpp"

#include <gpubind/driver/driver.hpp>

#include <memory>
#include <vector>

namespace gpubind::graphics {

inline constexpr size_t COPY_BUFFER_ALIGNMENT = 4;
inline constexpr size_t QUERY_RESOLVE_BUFFER_ALIGNMENT = 256;

class CommandBuffer {
public:
    CommandBuffer(std::shared_ptr<driver::CommandBuffer> handle, std::vector<std::shared_ptr<const void>> retained)
        : handle_(std::move(handle)), retained_(std::move(retained)) {}

    CommandBuffer(CommandBuffer&&) noexcept = default;
    CommandBuffer& operator=(CommandBuffer&&) noexcept = default;
    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

    [[nodiscard]] const driver::CommandBuffer& handle() const { return *handle_; }
    [[nodiscard]] size_t retained_count() const { return retained_.size(); }

private:
    std::shared_ptr<driver::CommandBuffer> handle_;
    std::vector<std::shared_ptr<const void>> retained_;
};

template<typename P = NoPipeline, typename R = NoBindGroups>
class ComputePassEncoder;

template<typename P, typename V, typename I, typename R, OcclusionQueryState Q>
class RenderPassEncoder;

template<OcclusionQueryState Q>
using InitialRenderPassEncoder = RenderPassEncoder<NoPipeline, NoVertexBuffers, NoIndexBuffer, NoBindGroups, Q>;

class CommandEncoder {
public:
    CommandEncoder(std::shared_ptr<driver::Device> device, std::unique_ptr<driver::CommandEncoder> encoder);

    CommandEncoder(CommandEncoder&&) noexcept = default;
    CommandEncoder& operator=(CommandEncoder&&) noexcept = default;
    CommandEncoder(const CommandEncoder&) = delete;
    CommandEncoder& operator=(const CommandEncoder&) = delete;

    // ========================================================================
    // Buffer Commands
    // ========================================================================

    // Offset and size must be multiples of 4
    template<typename T, BufferUsage U>
        requires(has_flag(U, BufferUsage::CopyDst))
    [[nodiscard]] CommandEncoder clear_buffer(const View<T, U>& view) && {
        encode_clear_buffer(view.resource(), view.byte_range());
        return std::move(*this);
    }

    // Both views must have the same length, offsets and size must be multiples of 4
    template<typename T, BufferUsage S, BufferUsage D>
        requires(has_flag(S, BufferUsage::CopySrc) && has_flag(D, BufferUsage::CopyDst))
    [[nodiscard]] CommandEncoder copy_buffer_to_buffer(const View<T, S>& source, const View<T, D>& destination) && {
        encode_copy_buffer_to_buffer(source.resource(), source.byte_range(), destination.resource(),
                                     destination.byte_range());
        return std::move(*this);
    }

    // ========================================================================
    // Image Copies
    // ========================================================================

    // Copies from the buffer into the texture from the origin to the end of the mip level
    template<BufferUsage U>
        requires(has_flag(U, BufferUsage::CopySrc))
    [[nodiscard]] CommandEncoder image_copy_buffer_to_texture(const ImageCopyBuffer<U>& source,
                                                              const ImageCopyTexture& destination) && {
        encode_buffer_to_texture(source.data(), destination, destination.remaining_size());
        return std::move(*this);
    }

    template<BufferUsage U>
        requires(has_flag(U, BufferUsage::CopySrc))
    [[nodiscard]] CommandEncoder sub_image_copy_buffer_to_texture(const ImageCopyBuffer<U>& source,
                                                                  const ImageCopyTexture& destination,
                                                                  const ImageCopySize3D& copy_size) && {
        encode_buffer_to_texture(source.data(), destination, copy_size);
        return std::move(*this);
    }

    template<BufferUsage U>
        requires(has_flag(U, BufferUsage::CopyDst))
    [[nodiscard]] CommandEncoder image_copy_texture_to_buffer(const ImageCopyTexture& source,
                                                              const ImageCopyBuffer<U>& destination) && {
        encode_texture_to_buffer(source, destination.data(), source.remaining_size());
        return std::move(*this);
    }

    template<BufferUsage U>
        requires(has_flag(U, BufferUsage::CopyDst))
    [[nodiscard]] CommandEncoder sub_image_copy_texture_to_buffer(const ImageCopyTexture& source,
                                                                  const ImageCopyBuffer<U>& destination,
                                                                  const ImageCopySize3D& copy_size) && {
        encode_texture_to_buffer(source, destination.data(), copy_size);
        return std::move(*this);
    }

    // Both endpoints must cover the same extent
    [[nodiscard]] CommandEncoder image_copy_texture_to_texture(const ImageCopyTexture& source,
                                                               const ImageCopyTexture& destination) &&;

    [[nodiscard]] CommandEncoder sub_image_copy_texture_to_texture(const ImageCopyTexture& source,
                                                                   const ImageCopyTexture& destination,
                                                                   const ImageCopySize3D& copy_size) &&;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] CommandEncoder write_timestamp(const TimestampQuerySet& query_set, uint32_t index) &&;

    // Resolves destination.len() queries starting at first_query
    template<BufferUsage U>
        requires(has_flag(U, BufferUsage::QueryResolve))
    [[nodiscard]] CommandEncoder resolve_occlusion_query_set(const OcclusionQuerySet& query_set,
                                                             uint32_t first_query,
                                                             const View<uint64_t[], U>& destination) && {
        encode_resolve_query_set(query_set.handle_ptr(), first_query, destination.len(), destination.resource(),
                                 destination.offset());
        return std::move(*this);
    }

    template<BufferUsage U>
        requires(has_flag(U, BufferUsage::QueryResolve))
    [[nodiscard]] CommandEncoder resolve_timestamp_query_set(const TimestampQuerySet& query_set,
                                                             uint32_t first_query,
                                                             const View<uint64_t[], U>& destination) && {
        encode_resolve_query_set(query_set.handle_ptr(), first_query, destination.len(), destination.resource(),
                                 destination.offset());
        return std::move(*this);
    }

    // ========================================================================
    // Passes
    // ========================================================================

    // The pass encoder owns this encoder until end() hands it back
    [[nodiscard]] ComputePassEncoder<> begin_compute_pass() &&;

    // Defined in render_pass.hpp
    template<OcclusionQueryState Q>
    [[nodiscard]] InitialRenderPassEncoder<Q> begin_render_pass(RenderPassDescriptor<Q> descriptor) &&;

    [[nodiscard]] CommandBuffer finish() &&;

private:
    template<typename, typename>
    friend class ComputePassEncoder;
    template<typename, typename, typename, typename, OcclusionQueryState>
    friend class RenderPassEncoder;

    void retain(std::shared_ptr<const void> resource) { retained_.push_back(std::move(resource)); }

    void encode_clear_buffer(const std::shared_ptr<detail::BufferResource>& buffer, ByteRange range);
    void encode_copy_buffer_to_buffer(const std::shared_ptr<detail::BufferResource>& source, ByteRange source_range,
                                      const std::shared_ptr<detail::BufferResource>& destination,
                                      ByteRange destination_range);
    void encode_buffer_to_texture(const detail::ImageCopyBufferData& source, const ImageCopyTexture& destination,
                                  const ImageCopySize3D& copy_size);
    void encode_texture_to_buffer(const ImageCopyTexture& source, const detail::ImageCopyBufferData& destination,
                                  const ImageCopySize3D& copy_size);
    void encode_texture_to_texture(const ImageCopyTexture& source, const ImageCopyTexture& destination,
                                   const ImageCopySize3D& copy_size);
    void encode_resolve_query_set(const std::shared_ptr<driver::QuerySet>& query_set, uint32_t first_query,
                                  size_t query_count, const std::shared_ptr<detail::BufferResource>& destination,
                                  size_t destination_offset);

    // Begins the driver render pass and retains everything the descriptor references
    [[nodiscard]] std::unique_ptr<driver::RenderPassEncoder> open_render_pass(
        const RenderTarget& target, const std::shared_ptr<driver::QuerySet>& occlusion_query_set);

    std::shared_ptr<driver::Device> device_;
    std::unique_ptr<driver::CommandEncoder> encoder_;
    std::vector<std::shared_ptr<const void>> retained_;
};

}  // namespace gpubind::graphics
