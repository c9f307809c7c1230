// GpuBind Graphics Layer
// texture.cpp - Texture view and copy validation

#include <gpubind/graphics/texture.hpp>

#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>

#include <algorithm>
#include <bit>

namespace gpubind::graphics {

uint32_t max_mipmap_levels(const driver::Extent3D& size, driver::TextureDimension dimension) {
    uint32_t largest = 0;
    switch (dimension) {
        case driver::TextureDimension::D1:
            return 1;
        case driver::TextureDimension::D2:
            largest = std::max(size.width, size.height);
            break;
        case driver::TextureDimension::D3:
            largest = std::max({size.width, size.height, size.depth_or_layers});
            break;
    }
    return largest == 0 ? 1 : static_cast<uint32_t>(std::bit_width(largest));
}

uint32_t MipmapLevels::resolve(const driver::Extent3D& size, driver::TextureDimension dimension) const {
    const uint32_t max_levels = max_mipmap_levels(size, dimension);
    if (!count_.has_value()) {
        return max_levels;
    }
    GPUBIND_ASSERT(*count_ >= 1, "a texture needs at least one mip level");
    GPUBIND_ASSERT(*count_ <= max_levels, "{} mip levels requested but a {}x{}x{} texture has at most {}", *count_,
                   size.width, size.height, size.depth_or_layers, max_levels);
    return *count_;
}

std::string UnsupportedViewFormat::what() const {
    std::string message = fmt::format("`{}` is not one of the supported formats: ", format::to_string(requested));
    for (size_t i = 0; i < supported.size(); ++i) {
        if (i > 0) {
            message += ", ";
        }
        message += fmt::format("`{}`", format::to_string(supported[i]));
    }
    return message;
}

// ============================================================================
// Texture View
// ============================================================================

TextureView::TextureView(std::shared_ptr<driver::TextureView> handle, std::shared_ptr<driver::Texture> texture,
                         TextureFormat format, driver::Extent3D size, uint32_t sample_count, TextureUsage usage)
    : handle_(std::move(handle)),
      texture_(std::move(texture)),
      format_(format),
      size_(size),
      sample_count_(sample_count),
      usage_(usage) {}

// ============================================================================
// Image Copy Texture
// ============================================================================

ImageCopyTexture::ImageCopyTexture(std::shared_ptr<driver::Texture> texture, TextureFormat format,
                                   TextureUsage usage, uint32_t sample_count, driver::Extent3D mip_size,
                                   uint32_t mip_level, driver::Origin3D origin)
    : texture_(std::move(texture)),
      format_(format),
      usage_(usage),
      sample_count_(sample_count),
      mip_size_(mip_size),
      mip_level_(mip_level),
      origin_(origin) {}

ImageCopySize3D ImageCopyTexture::remaining_size() const {
    return {mip_size_.width - origin_.x, mip_size_.height - origin_.y, mip_size_.depth_or_layers - origin_.z};
}

driver::ImageCopyTexture ImageCopyTexture::to_driver() const {
    return {texture_.get(), mip_level_, origin_, driver::TextureAspect::All};
}

namespace detail {

void validate_texture_copy(const ImageCopyTexture& texture, const ImageCopySize3D& copy_size) {
    const auto& info = format::format_info(texture.format());
    const auto& origin = texture.origin();
    // Compressed mip levels smaller than a block still occupy a whole block
    auto mip_size = texture.mip_size();
    mip_size.width = (mip_size.width + info.block_width - 1) / info.block_width * info.block_width;
    mip_size.height = (mip_size.height + info.block_height - 1) / info.block_height * info.block_height;

    GPUBIND_ASSERT(texture.sample_count() == 1, "multisampled textures can't be copied");
    copy_size.validate_with_block_size(info.block_width, info.block_height);

    GPUBIND_ASSERT(origin.x + copy_size.width <= mip_size.width &&
                       origin.y + copy_size.height <= mip_size.height &&
                       origin.z + copy_size.depth_or_layers <= mip_size.depth_or_layers,
                   "copy of {}x{}x{} at ({}, {}, {}) exceeds mip level {} of size {}x{}x{}", copy_size.width,
                   copy_size.height, copy_size.depth_or_layers, origin.x, origin.y, origin.z, texture.mip_level(),
                   mip_size.width, mip_size.height, mip_size.depth_or_layers);
}

void validate_texture_descriptor(const TextureDescriptor& desc) {
    const auto& info = format::format_info(desc.format);

    GPUBIND_ASSERT(desc.size.width > 0 && desc.size.height > 0 && desc.size.depth_or_layers > 0,
                   "texture size must be non-zero");
    GPUBIND_ASSERT(desc.size.width % info.block_width == 0 && desc.size.height % info.block_height == 0,
                   "texture size {}x{} is not a whole number of `{}` blocks", desc.size.width, desc.size.height,
                   info.name);

    if (has_flag(desc.usage, TextureUsage::RenderAttachment)) {
        GPUBIND_ASSERT(info.is_renderable(), "format `{}` can't be used as a render attachment", info.name);
    }
    if (has_flag(desc.usage, TextureUsage::StorageBinding)) {
        GPUBIND_ASSERT(info.is_storable(), "format `{}` can't be used as a storage texture", info.name);
    }
    if (has_flag(desc.usage, TextureUsage::TextureBinding)) {
        GPUBIND_ASSERT(info.is_samplable(), "format `{}` can't be sampled", info.name);
    }
    if (desc.sample_count > 1) {
        GPUBIND_ASSERT(desc.sample_count == 4, "sample count must be 1 or 4, got {}", desc.sample_count);
        GPUBIND_ASSERT(info.supports_multisample(), "format `{}` does not support multisampling", info.name);
        GPUBIND_ASSERT(desc.dimension == driver::TextureDimension::D2 && desc.size.depth_or_layers == 1,
                       "only single layer 2D textures can be multisampled");
    }

    for (auto view_format : desc.view_formats) {
        GPUBIND_ASSERT(format::is_copy_compatible(desc.format, view_format),
                       "view format `{}` is not compatible with `{}`", format::to_string(view_format), info.name);
    }
}

}  // namespace detail

// ============================================================================
// Texture
// ============================================================================

Texture::Texture(std::shared_ptr<driver::Texture> handle, TextureDescriptor desc, uint32_t mip_level_count)
    : handle_(std::move(handle)), desc_(std::move(desc)), mip_level_count_(mip_level_count) {}

uint32_t Texture::layers() const {
    return desc_.dimension == driver::TextureDimension::D3 ? 1 : desc_.size.depth_or_layers;
}

driver::Extent3D Texture::mip_size(uint32_t level) const {
    driver::Extent3D size;
    size.width = std::max(1u, desc_.size.width >> level);
    size.height = desc_.dimension == driver::TextureDimension::D1 ? 1 : std::max(1u, desc_.size.height >> level);
    size.depth_or_layers = desc_.dimension == driver::TextureDimension::D3
                               ? std::max(1u, desc_.size.depth_or_layers >> level)
                               : desc_.size.depth_or_layers;
    return size;
}

TextureView Texture::create_view(const TextureViewDescriptor& desc) const {
    return make_view(desc_.format, desc);
}

core::Result<TextureView, UnsupportedViewFormat> Texture::try_view_as(TextureFormat format,
                                                                     const TextureViewDescriptor& desc) const {
    const bool declared = std::find(desc_.view_formats.begin(), desc_.view_formats.end(), format) !=
                          desc_.view_formats.end();
    if (format != desc_.format && !declared) {
        std::vector<TextureFormat> supported{desc_.format};
        supported.insert(supported.end(), desc_.view_formats.begin(), desc_.view_formats.end());
        return core::unexpected(UnsupportedViewFormat{format, std::move(supported)});
    }
    return make_view(format, desc);
}

TextureView Texture::make_view(TextureFormat format, const TextureViewDescriptor& desc) const {
    const uint32_t layer_count = layers();
    GPUBIND_ASSERT(desc.base_array_layer < layer_count, "base array layer {} out of bounds for {} layers",
                   desc.base_array_layer, layer_count);
    const uint32_t array_layers = desc.array_layer_count.value_or(layer_count - desc.base_array_layer);
    GPUBIND_ASSERT(desc.base_array_layer + array_layers <= layer_count,
                   "array layers [{}, {}) out of bounds for {} layers", desc.base_array_layer,
                   desc.base_array_layer + array_layers, layer_count);

    GPUBIND_ASSERT(desc.base_mip_level < mip_level_count_, "base mip level {} out of bounds for {} levels",
                   desc.base_mip_level, mip_level_count_);
    const uint32_t mip_levels = desc.mip_level_count.value_or(mip_level_count_ - desc.base_mip_level);
    GPUBIND_ASSERT(desc.base_mip_level + mip_levels <= mip_level_count_,
                   "mip levels [{}, {}) out of bounds for {} levels", desc.base_mip_level,
                   desc.base_mip_level + mip_levels, mip_level_count_);

    driver::TextureViewDescriptor view_desc;
    view_desc.format = format;
    view_desc.aspect = desc.aspect;
    view_desc.base_mip_level = desc.base_mip_level;
    view_desc.mip_level_count = mip_levels;
    view_desc.base_array_layer = desc.base_array_layer;
    view_desc.array_layer_count = array_layers;
    if (desc.dimension.has_value()) {
        view_desc.dimension = *desc.dimension;
    } else if (desc_.dimension == driver::TextureDimension::D1) {
        view_desc.dimension = driver::TextureViewDimension::D1;
    } else if (desc_.dimension == driver::TextureDimension::D3) {
        view_desc.dimension = driver::TextureViewDimension::D3;
    } else {
        view_desc.dimension =
            array_layers > 1 ? driver::TextureViewDimension::D2Array : driver::TextureViewDimension::D2;
    }

    const auto size = mip_size(desc.base_mip_level);
    return TextureView(handle_->create_view(view_desc), handle_, format, {size.width, size.height, array_layers},
                       desc_.sample_count, desc_.usage);
}

ImageCopyTexture Texture::image_copy_texture(uint32_t mip_level) const {
    return sub_image_copy_texture(mip_level, driver::Origin3D{});
}

ImageCopyTexture Texture::sub_image_copy_texture(uint32_t mip_level, driver::Origin3D origin) const {
    GPUBIND_ASSERT(mip_level < mip_level_count_, "mip level {} out of bounds for {} levels", mip_level,
                   mip_level_count_);
    const auto& info = format::format_info(desc_.format);
    GPUBIND_ASSERT(origin.x % info.block_width == 0 && origin.y % info.block_height == 0,
                   "origin ({}, {}) is not aligned to the {}x{} blocks of `{}`", origin.x, origin.y,
                   info.block_width, info.block_height, info.name);

    const auto size = mip_size(mip_level);
    GPUBIND_ASSERT(origin.x <= size.width && origin.y <= size.height && origin.z <= size.depth_or_layers,
                   "origin ({}, {}, {}) lies outside mip level {}", origin.x, origin.y, origin.z, mip_level);
    return ImageCopyTexture(handle_, desc_.format, desc_.usage, desc_.sample_count, size, mip_level, origin);
}

}  // namespace gpubind::graphics
