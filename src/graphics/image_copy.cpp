// GpuBind Graphics Layer
// image_copy.cpp - Image copy buffer layout validation

#include <gpubind/graphics/image_copy.hpp>

#include <gpubind/core/assert.hpp>

namespace gpubind::graphics {

void ImageCopySize3D::validate_with_block_size(uint32_t block_width, uint32_t block_height) const {
    GPUBIND_ASSERT(width % block_width == 0, "copy width {} must be a multiple of the block width {}", width,
                   block_width);
    GPUBIND_ASSERT(height % block_height == 0, "copy height {} must be a multiple of the block height {}", height,
                   block_height);
}

namespace detail {

driver::ImageCopyBuffer ImageCopyBufferData::to_driver() const {
    return {&resource->handle(), offset, size, bytes_per_block, blocks_per_row, rows_per_image};
}

ImageCopyBufferData make_image_copy_buffer(std::shared_ptr<BufferResource> resource, size_t offset, size_t size,
                                           uint32_t bytes_per_block, uint32_t blocks_per_row,
                                           uint32_t rows_per_image) {
    const uint32_t bytes_per_row = bytes_per_block * blocks_per_row;
    GPUBIND_ASSERT(bytes_per_row % COPY_BYTES_PER_ROW_ALIGNMENT == 0,
                   "bytes per block row ({} * {} = {}) must be a multiple of `{}`", bytes_per_block,
                   blocks_per_row, bytes_per_row, COPY_BYTES_PER_ROW_ALIGNMENT);
    return ImageCopyBufferData{std::move(resource), offset, size, bytes_per_block, blocks_per_row, rows_per_image};
}

void validate_buffer_copy(const ImageCopyBufferData& buffer, format::TextureFormat format,
                          const ImageCopySize3D& copy_size) {
    const auto& info = format::format_info(format);
    GPUBIND_ASSERT(info.bytes_per_block != 0, "format `{}` can't be copied to or from a buffer", info.name);
    GPUBIND_ASSERT(buffer.bytes_per_block == info.bytes_per_block,
                   "buffer block size {} does not match the {} byte blocks of `{}`", buffer.bytes_per_block,
                   info.bytes_per_block, info.name);

    copy_size.validate_with_block_size(info.block_width, info.block_height);

    const uint64_t width_in_blocks = copy_size.width / info.block_width;
    const uint64_t height_in_blocks = copy_size.height / info.block_height;
    GPUBIND_ASSERT(buffer.blocks_per_row >= width_in_blocks, "{} blocks per row can't hold a copy {} blocks wide",
                   buffer.blocks_per_row, width_in_blocks);
    GPUBIND_ASSERT(copy_size.depth_or_layers <= 1 || buffer.rows_per_image >= height_in_blocks,
                   "{} rows per image can't hold a copy {} blocks high", buffer.rows_per_image, height_in_blocks);

    if (width_in_blocks == 0 || height_in_blocks == 0 || copy_size.depth_or_layers == 0) {
        return;
    }

    const uint64_t bytes_per_row = buffer.bytes_per_row();
    const uint64_t bytes_per_image = bytes_per_row * buffer.rows_per_image;
    const uint64_t required = bytes_per_image * (copy_size.depth_or_layers - 1) +
                              bytes_per_row * (height_in_blocks - 1) + width_in_blocks * info.bytes_per_block;
    GPUBIND_ASSERT(required <= buffer.size, "copy requires {} bytes but the buffer range holds {}", required,
                   buffer.size);
}

}  // namespace detail

}  // namespace gpubind::graphics
