// GpuBind Format Table
// texture_format.hpp - Texture formats and their static capabilities

#pragma once

#include <cstdint>
#include <string_view>

namespace gpubind::format {

// Order matches the capability table in texture_format.cpp
enum class TextureFormat : uint32_t {
    // 8-bit formats
    R8Unorm,
    R8Snorm,
    R8Uint,
    R8Sint,

    // 16-bit formats
    R16Uint,
    R16Sint,
    R16Float,
    RG8Unorm,
    RG8Snorm,
    RG8Uint,
    RG8Sint,

    // 32-bit formats
    R32Uint,
    R32Sint,
    R32Float,
    RG16Uint,
    RG16Sint,
    RG16Float,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    RGBA8Snorm,
    RGBA8Uint,
    RGBA8Sint,
    BGRA8Unorm,
    BGRA8UnormSrgb,

    // Packed 32-bit formats
    RGB9E5Ufloat,
    RGB10A2Uint,
    RGB10A2Unorm,
    RG11B10Ufloat,

    // 64-bit formats
    RG32Uint,
    RG32Sint,
    RG32Float,
    RGBA16Uint,
    RGBA16Sint,
    RGBA16Float,

    // 128-bit formats
    RGBA32Uint,
    RGBA32Sint,
    RGBA32Float,

    // Depth/stencil formats
    Stencil8,
    Depth16Unorm,
    Depth24Plus,
    Depth24PlusStencil8,
    Depth32Float,
    Depth32FloatStencil8,

    // BC compressed formats
    BC1RgbaUnorm,
    BC1RgbaUnormSrgb,
    BC2RgbaUnorm,
    BC2RgbaUnormSrgb,
    BC3RgbaUnorm,
    BC3RgbaUnormSrgb,
    BC4RUnorm,
    BC4RSnorm,
    BC5RgUnorm,
    BC5RgSnorm,
    BC6HRgbUfloat,
    BC6HRgbFloat,
    BC7RgbaUnorm,
    BC7RgbaUnormSrgb,

    // ETC2/EAC compressed formats
    ETC2Rgb8Unorm,
    ETC2Rgb8UnormSrgb,
    ETC2Rgb8A1Unorm,
    ETC2Rgb8A1UnormSrgb,
    ETC2Rgba8Unorm,
    ETC2Rgba8UnormSrgb,
    EACR11Unorm,
    EACR11Snorm,
    EACRg11Unorm,
    EACRg11Snorm,

    // ASTC compressed formats
    ASTC4x4Unorm,
    ASTC4x4UnormSrgb,
    ASTC5x4Unorm,
    ASTC5x4UnormSrgb,
    ASTC5x5Unorm,
    ASTC5x5UnormSrgb,
    ASTC6x5Unorm,
    ASTC6x5UnormSrgb,
    ASTC6x6Unorm,
    ASTC6x6UnormSrgb,
    ASTC8x5Unorm,
    ASTC8x5UnormSrgb,
    ASTC8x6Unorm,
    ASTC8x6UnormSrgb,
    ASTC8x8Unorm,
    ASTC8x8UnormSrgb,
    ASTC10x5Unorm,
    ASTC10x5UnormSrgb,
    ASTC10x6Unorm,
    ASTC10x6UnormSrgb,
    ASTC10x8Unorm,
    ASTC10x8UnormSrgb,
    ASTC10x10Unorm,
    ASTC10x10UnormSrgb,
    ASTC12x10Unorm,
    ASTC12x10UnormSrgb,
    ASTC12x12Unorm,
    ASTC12x12UnormSrgb,
};

inline constexpr uint32_t TEXTURE_FORMAT_COUNT = static_cast<uint32_t>(TextureFormat::ASTC12x12UnormSrgb) + 1;

enum class SampleType : uint8_t {
    Float,
    UnfilterableFloat,
    SignedInteger,
    UnsignedInteger,
    Depth,
};

enum class FormatCapability : uint32_t {
    None = 0,
    Samplable = 1 << 0,
    Filterable = 1 << 1,
    Renderable = 1 << 2,
    Blendable = 1 << 3,
    Storage = 1 << 4,
    Multisample = 1 << 5,
    CopySrc = 1 << 6,
    CopyDst = 1 << 7,
    Depth = 1 << 8,
    Stencil = 1 << 9,
    Srgb = 1 << 10,
    Compressed = 1 << 11,
};

constexpr FormatCapability operator|(FormatCapability a, FormatCapability b) {
    return static_cast<FormatCapability>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr FormatCapability operator&(FormatCapability a, FormatCapability b) {
    return static_cast<FormatCapability>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool has_flag(FormatCapability flags, FormatCapability flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

struct FormatInfo {
    TextureFormat format;
    std::string_view name;
    uint32_t block_width;
    uint32_t block_height;
    uint32_t bytes_per_block;  // 0 when the format has no defined copy footprint
    SampleType sample_type;
    FormatCapability capabilities;

    [[nodiscard]] bool is(FormatCapability capability) const { return has_flag(capabilities, capability); }
    [[nodiscard]] bool is_samplable() const { return is(FormatCapability::Samplable); }
    [[nodiscard]] bool is_filterable() const { return is(FormatCapability::Filterable); }
    [[nodiscard]] bool is_renderable() const { return is(FormatCapability::Renderable); }
    [[nodiscard]] bool is_blendable() const { return is(FormatCapability::Blendable); }
    [[nodiscard]] bool is_storable() const { return is(FormatCapability::Storage); }
    [[nodiscard]] bool supports_multisample() const { return is(FormatCapability::Multisample); }
    [[nodiscard]] bool is_copy_src() const { return is(FormatCapability::CopySrc); }
    [[nodiscard]] bool is_copy_dst() const { return is(FormatCapability::CopyDst); }
    [[nodiscard]] bool has_depth() const { return is(FormatCapability::Depth); }
    [[nodiscard]] bool has_stencil() const { return is(FormatCapability::Stencil); }
    [[nodiscard]] bool is_srgb() const { return is(FormatCapability::Srgb); }
    [[nodiscard]] bool is_compressed() const { return is(FormatCapability::Compressed); }
};

[[nodiscard]] const FormatInfo& format_info(TextureFormat format);
[[nodiscard]] std::string_view to_string(TextureFormat format);

// Maps an srgb format to its linear counterpart, other formats map to themselves
[[nodiscard]] TextureFormat linear_variant(TextureFormat format);

// Texture-to-texture copies require equal formats up to srgb-ness
[[nodiscard]] bool is_copy_compatible(TextureFormat a, TextureFormat b);

}  // namespace gpubind::format
