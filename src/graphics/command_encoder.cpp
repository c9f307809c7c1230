// GpuBind Graphics Layer
// command_encoder.cpp - Command validation and resource retention

#include <gpubind/graphics/command_encoder.hpp>
#include <gpubind/graphics/compute_pass.hpp>

#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>

namespace gpubind::graphics {

CommandEncoder::CommandEncoder(std::shared_ptr<driver::Device> device, std::unique_ptr<driver::CommandEncoder> encoder)
    : device_(std::move(device)), encoder_(std::move(encoder)) {}

// ============================================================================
// Buffer Commands
// ============================================================================

void CommandEncoder::encode_clear_buffer(const std::shared_ptr<detail::BufferResource>& buffer, ByteRange range) {
    GPUBIND_ASSERT(range.start % COPY_BUFFER_ALIGNMENT == 0, "clear offset {} must be a multiple of 4", range.start);
    GPUBIND_ASSERT(range.size() % COPY_BUFFER_ALIGNMENT == 0, "clear size {} must be a multiple of 4", range.size());

    encoder_->clear_buffer({&buffer->handle(), range.start, range.size()});
    retain(buffer);
}

void CommandEncoder::encode_copy_buffer_to_buffer(const std::shared_ptr<detail::BufferResource>& source,
                                                  ByteRange source_range,
                                                  const std::shared_ptr<detail::BufferResource>& destination,
                                                  ByteRange destination_range) {
    GPUBIND_ASSERT(source_range.size() == destination_range.size(),
                   "source and destination have different lengths ({} and {} bytes)", source_range.size(),
                   destination_range.size());
    GPUBIND_ASSERT(source_range.start % COPY_BUFFER_ALIGNMENT == 0, "source offset {} must be a multiple of 4",
                   source_range.start);
    GPUBIND_ASSERT(destination_range.start % COPY_BUFFER_ALIGNMENT == 0,
                   "destination offset {} must be a multiple of 4", destination_range.start);
    GPUBIND_ASSERT(source_range.size() % COPY_BUFFER_ALIGNMENT == 0, "copy size {} must be a multiple of 4",
                   source_range.size());
    if (source->id() == destination->id()) {
        GPUBIND_ASSERT(!source_range.intersects(destination_range),
                       "source and destination ranges of a copy within one buffer must not overlap");
    }

    encoder_->copy_buffer_to_buffer(
        {&source->handle(), source_range.start, &destination->handle(), destination_range.start, source_range.size()});
    retain(source);
    retain(destination);
}

// ============================================================================
// Image Copies
// ============================================================================

void CommandEncoder::encode_buffer_to_texture(const detail::ImageCopyBufferData& source,
                                              const ImageCopyTexture& destination, const ImageCopySize3D& copy_size) {
    GPUBIND_ASSERT(has_flag(destination.usage(), TextureUsage::CopyDst),
                   "destination texture was not created with the CopyDst usage");
    detail::validate_texture_copy(destination, copy_size);
    detail::validate_buffer_copy(source, destination.format(), copy_size);

    encoder_->copy_buffer_to_texture({source.to_driver(), destination.to_driver(), copy_size.to_extent()});
    retain(source.resource);
    retain(destination.texture_ptr());
}

void CommandEncoder::encode_texture_to_buffer(const ImageCopyTexture& source,
                                              const detail::ImageCopyBufferData& destination,
                                              const ImageCopySize3D& copy_size) {
    GPUBIND_ASSERT(has_flag(source.usage(), TextureUsage::CopySrc),
                   "source texture was not created with the CopySrc usage");
    detail::validate_texture_copy(source, copy_size);
    detail::validate_buffer_copy(destination, source.format(), copy_size);

    encoder_->copy_texture_to_buffer({source.to_driver(), destination.to_driver(), copy_size.to_extent()});
    retain(source.texture_ptr());
    retain(destination.resource);
}

void CommandEncoder::encode_texture_to_texture(const ImageCopyTexture& source, const ImageCopyTexture& destination,
                                               const ImageCopySize3D& copy_size) {
    GPUBIND_ASSERT(has_flag(source.usage(), TextureUsage::CopySrc),
                   "source texture was not created with the CopySrc usage");
    GPUBIND_ASSERT(has_flag(destination.usage(), TextureUsage::CopyDst),
                   "destination texture was not created with the CopyDst usage");
    GPUBIND_ASSERT(format::is_copy_compatible(source.format(), destination.format()),
                   "can't copy between `{}` and `{}` textures", format::to_string(source.format()),
                   format::to_string(destination.format()));
    detail::validate_texture_copy(source, copy_size);
    detail::validate_texture_copy(destination, copy_size);

    encoder_->copy_texture_to_texture({source.to_driver(), destination.to_driver(), copy_size.to_extent()});
    retain(source.texture_ptr());
    retain(destination.texture_ptr());
}

CommandEncoder CommandEncoder::image_copy_texture_to_texture(const ImageCopyTexture& source,
                                                             const ImageCopyTexture& destination) && {
    const auto copy_size = source.remaining_size();
    GPUBIND_ASSERT(copy_size == destination.remaining_size(),
                   "source and destination have different sizes ({}x{}x{} and {}x{}x{})", copy_size.width,
                   copy_size.height, copy_size.depth_or_layers, destination.remaining_size().width,
                   destination.remaining_size().height, destination.remaining_size().depth_or_layers);
    encode_texture_to_texture(source, destination, copy_size);
    return std::move(*this);
}

CommandEncoder CommandEncoder::sub_image_copy_texture_to_texture(const ImageCopyTexture& source,
                                                                 const ImageCopyTexture& destination,
                                                                 const ImageCopySize3D& copy_size) && {
    encode_texture_to_texture(source, destination, copy_size);
    return std::move(*this);
}

// ============================================================================
// Queries
// ============================================================================

CommandEncoder CommandEncoder::write_timestamp(const TimestampQuerySet& query_set, uint32_t index) && {
    GPUBIND_ASSERT(index < query_set.len(), "timestamp index {} out of bounds for a query set of {}", index,
                   query_set.len());
    encoder_->write_timestamp(query_set.handle(), index);
    retain(query_set.handle_ptr());
    return std::move(*this);
}

void CommandEncoder::encode_resolve_query_set(const std::shared_ptr<driver::QuerySet>& query_set,
                                              uint32_t first_query, size_t query_count,
                                              const std::shared_ptr<detail::BufferResource>& destination,
                                              size_t destination_offset) {
    GPUBIND_ASSERT(uint64_t{first_query} + query_count <= query_set->count(),
                   "resolve range out of bounds: queries [{}, {}) of {}", first_query,
                   uint64_t{first_query} + query_count, query_set->count());
    GPUBIND_ASSERT(destination_offset % QUERY_RESOLVE_BUFFER_ALIGNMENT == 0,
                   "resolve destination offset {} must be a multiple of 256", destination_offset);

    driver::ResolveQuerySet op;
    op.query_set = query_set.get();
    op.first_query = first_query;
    op.query_count = static_cast<uint32_t>(query_count);
    op.destination = &destination->handle();
    op.destination_offset = destination_offset;
    encoder_->resolve_query_set(op);
    retain(query_set);
    retain(destination);
}

// ============================================================================
// Passes
// ============================================================================

ComputePassEncoder<> CommandEncoder::begin_compute_pass() && {
    auto pass = encoder_->begin_compute_pass();
    return ComputePassEncoder<>(detail::ComputePassParts{std::move(*this), std::move(pass), {}});
}

std::unique_ptr<driver::RenderPassEncoder> CommandEncoder::open_render_pass(
    const RenderTarget& target, const std::shared_ptr<driver::QuerySet>& occlusion_query_set) {
    auto pass = encoder_->begin_render_pass(detail::to_driver(target, occlusion_query_set.get()));

    auto retain_view = [this](const TextureView& view) {
        retain(view.handle_ptr());
        retain(view.texture_ptr());
    };
    for (const auto& attachment : target.color_attachments) {
        retain_view(attachment.view);
        if (attachment.resolve_target.has_value()) {
            retain_view(*attachment.resolve_target);
        }
    }
    if (target.depth_stencil.has_value()) {
        retain_view(target.depth_stencil->view);
    }
    if (occlusion_query_set) {
        retain(occlusion_query_set);
    }
    return pass;
}

CommandBuffer CommandEncoder::finish() && {
    auto handle = encoder_->finish();
    GPUBIND_LOG_DEBUG(core::LogCategory::Command, "Finished command buffer retaining {} resources",
                      retained_.size());
    encoder_.reset();
    return CommandBuffer(std::move(handle), std::move(retained_));
}

}  // namespace gpubind::graphics
