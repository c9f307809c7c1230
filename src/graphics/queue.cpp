// GpuBind Graphics Layer
// queue.cpp - Submission and write validation

#include <gpubind/graphics/queue.hpp>

#include <gpubind/core/logger.hpp>

namespace gpubind::graphics {

void Queue::submit(const CommandBuffer& command_buffer) const {
    GPUBIND_LOG_DEBUG(core::LogCategory::Command, "Submitting command buffer retaining {} resources",
                      command_buffer.retained_count());
    queue_->submit(command_buffer.handle());
}

void Queue::write_buffer_bytes(detail::BufferResource& buffer, size_t offset, std::span<const std::byte> data) const {
    GPUBIND_ASSERT(offset % COPY_BUFFER_ALIGNMENT == 0, "write offset {} must be a multiple of 4", offset);
    GPUBIND_ASSERT(data.size() % COPY_BUFFER_ALIGNMENT == 0, "write size {} must be a multiple of 4", data.size());
    GPUBIND_ASSERT(!buffer.is_mapped(), "cannot write to buffer {} while it is mapped", buffer.id());

    queue_->write_buffer({&buffer.handle(), offset, data});
}

void Queue::write_texture(const ImageCopyTexture& destination, std::span<const std::byte> data,
                          const driver::ImageDataLayout& layout, const ImageCopySize3D& size) const {
    GPUBIND_ASSERT(has_flag(destination.usage(), TextureUsage::CopyDst),
                   "destination texture was not created with the CopyDst usage");
    detail::validate_texture_copy(destination, size);

    const auto& info = format::format_info(destination.format());
    const uint64_t blocks_per_row = (size.width + info.block_width - 1) / info.block_width;
    const uint64_t rows = (size.height + info.block_height - 1) / info.block_height;
    const uint64_t row_bytes = blocks_per_row * info.bytes_per_block;
    GPUBIND_ASSERT(layout.bytes_per_row >= row_bytes, "bytes per row {} can't hold a row of {} bytes",
                   layout.bytes_per_row, row_bytes);
    GPUBIND_ASSERT(size.depth_or_layers == 1 || layout.rows_per_image >= rows,
                   "rows per image {} can't hold {} rows", layout.rows_per_image, rows);

    uint64_t required = 0;
    if (size.width > 0 && size.height > 0 && size.depth_or_layers > 0) {
        required = uint64_t{layout.bytes_per_row} * layout.rows_per_image * (size.depth_or_layers - 1) +
                   uint64_t{layout.bytes_per_row} * (rows - 1) + row_bytes;
    }
    GPUBIND_ASSERT(layout.offset + required <= data.size(), "texture write needs {} bytes at offset {} but got {}",
                   required, layout.offset, data.size());

    queue_->write_texture({destination.to_driver(), layout, size.to_extent(), data});
}

}  // namespace gpubind::graphics
