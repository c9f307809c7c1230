// GpuBind Graphics Layer
// image_copy.hpp - Buffer endpoints of buffer/texture image copies

#pragma once

#include "buffer_resource.hpp"

#include <gpubind/format/texture_format.hpp>

#include <memory>

namespace gpubind::graphics {

// Every buffer row of an image copy starts on this byte boundary
inline constexpr uint32_t COPY_BYTES_PER_ROW_ALIGNMENT = 256;

// Layout of a typed endpoint, the block size is the element size
struct ImageCopyBufferLayout {
    uint32_t blocks_per_row = 0;
    uint32_t rows_per_image = 0;
};

// Layout of a byte endpoint with an explicit block size
struct ImageCopyBufferRawLayout {
    uint32_t bytes_per_block = 0;
    uint32_t blocks_per_row = 0;
    uint32_t rows_per_image = 0;
};

struct ImageCopySize3D {
    uint32_t width = 1;
    uint32_t height = 1;
    uint32_t depth_or_layers = 1;

    // Fatal unless width and height are whole blocks
    void validate_with_block_size(uint32_t block_width, uint32_t block_height) const;

    [[nodiscard]] driver::Extent3D to_extent() const { return {width, height, depth_or_layers}; }

    bool operator==(const ImageCopySize3D&) const = default;
};

namespace detail {

struct ImageCopyBufferData {
    std::shared_ptr<BufferResource> resource;
    size_t offset = 0;
    size_t size = 0;
    uint32_t bytes_per_block = 0;
    uint32_t blocks_per_row = 0;
    uint32_t rows_per_image = 0;

    [[nodiscard]] uint32_t bytes_per_row() const { return bytes_per_block * blocks_per_row; }
    [[nodiscard]] driver::ImageCopyBuffer to_driver() const;
};

// Fatal unless the row pitch is a multiple of COPY_BYTES_PER_ROW_ALIGNMENT
[[nodiscard]] ImageCopyBufferData make_image_copy_buffer(std::shared_ptr<BufferResource> resource, size_t offset,
                                                         size_t size, uint32_t bytes_per_block,
                                                         uint32_t blocks_per_row, uint32_t rows_per_image);

// Fatal unless the endpoint can hold a copy of the given size in the given format
void validate_buffer_copy(const ImageCopyBufferData& buffer, format::TextureFormat format,
                          const ImageCopySize3D& copy_size);

}  // namespace detail

// Typed by the usage of the buffer so encoders can require CopySrc or CopyDst
template<driver::BufferUsage U>
class ImageCopyBuffer {
public:
    explicit ImageCopyBuffer(detail::ImageCopyBufferData data) : data_(std::move(data)) {}

    [[nodiscard]] const detail::ImageCopyBufferData& data() const { return data_; }
    [[nodiscard]] uint32_t bytes_per_block() const { return data_.bytes_per_block; }
    [[nodiscard]] uint32_t bytes_per_row() const { return data_.bytes_per_row(); }
    [[nodiscard]] uint32_t rows_per_image() const { return data_.rows_per_image; }

private:
    detail::ImageCopyBufferData data_;
};

}  // namespace gpubind::graphics
