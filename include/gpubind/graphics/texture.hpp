// GpuBind Graphics Layer
// texture.hpp - Textures, texture views and texture image-copy endpoints

#pragma once

#include "image_copy.hpp"

#include <gpubind/core/result.hpp>
#include <gpubind/driver/driver.hpp>
#include <gpubind/format/texture_format.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gpubind::graphics {

using driver::TextureUsage;
using format::TextureFormat;

// Number of mip levels a texture is created with
class MipmapLevels {
public:
    // Every level down to 1x1
    [[nodiscard]] static MipmapLevels complete() { return MipmapLevels(std::nullopt); }
    [[nodiscard]] static MipmapLevels partial(uint32_t count) { return MipmapLevels(count); }

    // Fatal when a partial count exceeds what the size allows
    [[nodiscard]] uint32_t resolve(const driver::Extent3D& size, driver::TextureDimension dimension) const;

private:
    explicit MipmapLevels(std::optional<uint32_t> count) : count_(count) {}

    std::optional<uint32_t> count_;
};

// floor(log2(largest dimension)) + 1, a single level for 1D textures
[[nodiscard]] uint32_t max_mipmap_levels(const driver::Extent3D& size, driver::TextureDimension dimension);

struct TextureDescriptor {
    driver::Extent3D size;
    driver::TextureDimension dimension = driver::TextureDimension::D2;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    MipmapLevels mipmap_levels = MipmapLevels::partial(1);
    uint32_t sample_count = 1;
    TextureUsage usage = TextureUsage::None;
    std::vector<TextureFormat> view_formats;
    std::string label;
};

struct TextureViewDescriptor {
    std::optional<driver::TextureViewDimension> dimension;
    driver::TextureAspect aspect = driver::TextureAspect::All;
    uint32_t base_mip_level = 0;
    std::optional<uint32_t> mip_level_count;  // Remaining levels when unset
    uint32_t base_array_layer = 0;
    std::optional<uint32_t> array_layer_count;  // Remaining layers when unset
};

struct UnsupportedViewFormat {
    TextureFormat requested;
    std::vector<TextureFormat> supported;

    [[nodiscard]] std::string what() const;
};

// ============================================================================
// Texture View
// ============================================================================

class TextureView {
public:
    TextureView(std::shared_ptr<driver::TextureView> handle, std::shared_ptr<driver::Texture> texture,
                TextureFormat format, driver::Extent3D size, uint32_t sample_count, TextureUsage usage);

    [[nodiscard]] const driver::TextureView& handle() const { return *handle_; }
    [[nodiscard]] const std::shared_ptr<driver::TextureView>& handle_ptr() const { return handle_; }
    [[nodiscard]] const std::shared_ptr<driver::Texture>& texture_ptr() const { return texture_; }

    [[nodiscard]] TextureFormat format() const { return format_; }
    [[nodiscard]] uint32_t width() const { return size_.width; }
    [[nodiscard]] uint32_t height() const { return size_.height; }
    [[nodiscard]] uint32_t sample_count() const { return sample_count_; }
    [[nodiscard]] TextureUsage usage() const { return usage_; }

private:
    std::shared_ptr<driver::TextureView> handle_;
    std::shared_ptr<driver::Texture> texture_;
    TextureFormat format_;
    driver::Extent3D size_;
    uint32_t sample_count_;
    TextureUsage usage_;
};

// ============================================================================
// Image Copy Texture
// ============================================================================

class ImageCopyTexture {
public:
    ImageCopyTexture(std::shared_ptr<driver::Texture> texture, TextureFormat format, TextureUsage usage,
                     uint32_t sample_count, driver::Extent3D mip_size, uint32_t mip_level, driver::Origin3D origin);

    [[nodiscard]] TextureFormat format() const { return format_; }
    [[nodiscard]] TextureUsage usage() const { return usage_; }
    [[nodiscard]] uint32_t sample_count() const { return sample_count_; }
    [[nodiscard]] const driver::Extent3D& mip_size() const { return mip_size_; }
    [[nodiscard]] uint32_t mip_level() const { return mip_level_; }
    [[nodiscard]] const driver::Origin3D& origin() const { return origin_; }
    [[nodiscard]] const std::shared_ptr<driver::Texture>& texture_ptr() const { return texture_; }

    // The extent from the origin to the end of the mip level
    [[nodiscard]] ImageCopySize3D remaining_size() const;

    [[nodiscard]] driver::ImageCopyTexture to_driver() const;

private:
    std::shared_ptr<driver::Texture> texture_;
    TextureFormat format_;
    TextureUsage usage_;
    uint32_t sample_count_;
    driver::Extent3D mip_size_;
    uint32_t mip_level_;
    driver::Origin3D origin_;
};

namespace detail {

// Fatal unless the copy fits inside the mip level of the endpoint
void validate_texture_copy(const ImageCopyTexture& texture, const ImageCopySize3D& copy_size);

void validate_texture_descriptor(const TextureDescriptor& desc);

}  // namespace detail

// ============================================================================
// Texture
// ============================================================================

class Texture {
public:
    Texture(std::shared_ptr<driver::Texture> handle, TextureDescriptor desc, uint32_t mip_level_count);

    Texture(Texture&&) noexcept = default;
    Texture& operator=(Texture&&) noexcept = default;
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    [[nodiscard]] const driver::Extent3D& size() const { return desc_.size; }
    [[nodiscard]] uint32_t width() const { return desc_.size.width; }
    [[nodiscard]] uint32_t height() const { return desc_.size.height; }
    [[nodiscard]] uint32_t layers() const;
    [[nodiscard]] driver::TextureDimension dimension() const { return desc_.dimension; }
    [[nodiscard]] TextureFormat format() const { return desc_.format; }
    [[nodiscard]] uint32_t mip_level_count() const { return mip_level_count_; }
    [[nodiscard]] uint32_t sample_count() const { return desc_.sample_count; }
    [[nodiscard]] TextureUsage usage() const { return desc_.usage; }
    [[nodiscard]] const std::vector<TextureFormat>& view_formats() const { return desc_.view_formats; }

    [[nodiscard]] const driver::Texture& handle() const { return *handle_; }
    [[nodiscard]] const std::shared_ptr<driver::Texture>& handle_ptr() const { return handle_; }

    // Size of a mip level, depth is kept for 3D textures and layer count otherwise
    [[nodiscard]] driver::Extent3D mip_size(uint32_t level) const;

    // Fatal when the layer or mip range exceeds the texture
    [[nodiscard]] TextureView create_view(const TextureViewDescriptor& desc = {}) const;

    // Views in another format must have been declared in view_formats
    [[nodiscard]] core::Result<TextureView, UnsupportedViewFormat> try_view_as(
        TextureFormat format, const TextureViewDescriptor& desc = {}) const;

    [[nodiscard]] ImageCopyTexture image_copy_texture(uint32_t mip_level) const;

    // The origin must be block aligned for the texture format
    [[nodiscard]] ImageCopyTexture sub_image_copy_texture(uint32_t mip_level, driver::Origin3D origin) const;

    void destroy() const { handle_->destroy(); }

private:
    [[nodiscard]] TextureView make_view(TextureFormat format, const TextureViewDescriptor& desc) const;

    std::shared_ptr<driver::Texture> handle_;
    TextureDescriptor desc_;
    uint32_t mip_level_count_;
};

}  // namespace gpubind::graphics
