// GpuBind Format Table
// texture_format.cpp - Capability table for all texture formats

#include <array>
#include <gpubind/core/assert.hpp>
#include <gpubind/format/texture_format.hpp>

namespace gpubind::format {

namespace {

using F = TextureFormat;
using S = SampleType;
using C = FormatCapability;

constexpr C SAMPLE = C::Samplable | C::Filterable;
constexpr C COPY = C::CopySrc | C::CopyDst;

// Renderable, blendable, multisampled color format that can be filtered
constexpr C COLOR = SAMPLE | C::Renderable | C::Blendable | C::Multisample | COPY;
// Renderable integer format, sampled without filtering
constexpr C INTEGER = C::Samplable | C::Renderable | C::Multisample | COPY;
constexpr C COMPRESSED = SAMPLE | COPY | C::Compressed;

constexpr std::array<FormatInfo, TEXTURE_FORMAT_COUNT> FORMAT_TABLE = {{
    {F::R8Unorm, "r8unorm", 1, 1, 1, S::Float, COLOR},
    {F::R8Snorm, "r8snorm", 1, 1, 1, S::Float, SAMPLE | COPY},
    {F::R8Uint, "r8uint", 1, 1, 1, S::UnsignedInteger, INTEGER},
    {F::R8Sint, "r8sint", 1, 1, 1, S::SignedInteger, INTEGER},

    {F::R16Uint, "r16uint", 1, 1, 2, S::UnsignedInteger, INTEGER},
    {F::R16Sint, "r16sint", 1, 1, 2, S::SignedInteger, INTEGER},
    {F::R16Float, "r16float", 1, 1, 2, S::Float, COLOR},
    {F::RG8Unorm, "rg8unorm", 1, 1, 2, S::Float, COLOR},
    {F::RG8Snorm, "rg8snorm", 1, 1, 2, S::Float, SAMPLE | COPY},
    {F::RG8Uint, "rg8uint", 1, 1, 2, S::UnsignedInteger, INTEGER},
    {F::RG8Sint, "rg8sint", 1, 1, 2, S::SignedInteger, INTEGER},

    {F::R32Uint, "r32uint", 1, 1, 4, S::UnsignedInteger, C::Samplable | C::Renderable | C::Storage | COPY},
    {F::R32Sint, "r32sint", 1, 1, 4, S::SignedInteger, C::Samplable | C::Renderable | C::Storage | COPY},
    {F::R32Float, "r32float", 1, 1, 4, S::UnfilterableFloat,
     C::Samplable | C::Renderable | C::Storage | C::Multisample | COPY},
    {F::RG16Uint, "rg16uint", 1, 1, 4, S::UnsignedInteger, INTEGER},
    {F::RG16Sint, "rg16sint", 1, 1, 4, S::SignedInteger, INTEGER},
    {F::RG16Float, "rg16float", 1, 1, 4, S::Float, COLOR},
    {F::RGBA8Unorm, "rgba8unorm", 1, 1, 4, S::Float, COLOR | C::Storage},
    {F::RGBA8UnormSrgb, "rgba8unorm-srgb", 1, 1, 4, S::Float, COLOR | C::Srgb},
    {F::RGBA8Snorm, "rgba8snorm", 1, 1, 4, S::Float, SAMPLE | C::Storage | COPY},
    {F::RGBA8Uint, "rgba8uint", 1, 1, 4, S::UnsignedInteger, INTEGER | C::Storage},
    {F::RGBA8Sint, "rgba8sint", 1, 1, 4, S::SignedInteger, INTEGER | C::Storage},
    {F::BGRA8Unorm, "bgra8unorm", 1, 1, 4, S::Float, COLOR},
    {F::BGRA8UnormSrgb, "bgra8unorm-srgb", 1, 1, 4, S::Float, COLOR | C::Srgb},

    {F::RGB9E5Ufloat, "rgb9e5ufloat", 1, 1, 4, S::Float, SAMPLE | COPY},
    {F::RGB10A2Uint, "rgb10a2uint", 1, 1, 4, S::UnsignedInteger, INTEGER},
    {F::RGB10A2Unorm, "rgb10a2unorm", 1, 1, 4, S::Float, COLOR},
    {F::RG11B10Ufloat, "rg11b10ufloat", 1, 1, 4, S::Float, SAMPLE | COPY},

    {F::RG32Uint, "rg32uint", 1, 1, 8, S::UnsignedInteger, C::Samplable | C::Renderable | C::Storage | COPY},
    {F::RG32Sint, "rg32sint", 1, 1, 8, S::SignedInteger, C::Samplable | C::Renderable | C::Storage | COPY},
    {F::RG32Float, "rg32float", 1, 1, 8, S::UnfilterableFloat, C::Samplable | C::Renderable | C::Storage | COPY},
    {F::RGBA16Uint, "rgba16uint", 1, 1, 8, S::UnsignedInteger, INTEGER | C::Storage},
    {F::RGBA16Sint, "rgba16sint", 1, 1, 8, S::SignedInteger, INTEGER | C::Storage},
    {F::RGBA16Float, "rgba16float", 1, 1, 8, S::Float, COLOR | C::Storage},

    {F::RGBA32Uint, "rgba32uint", 1, 1, 16, S::UnsignedInteger, C::Samplable | C::Renderable | C::Storage | COPY},
    {F::RGBA32Sint, "rgba32sint", 1, 1, 16, S::SignedInteger, C::Samplable | C::Renderable | C::Storage | COPY},
    {F::RGBA32Float, "rgba32float", 1, 1, 16, S::UnfilterableFloat,
     C::Samplable | C::Renderable | C::Storage | COPY},

    {F::Stencil8, "stencil8", 1, 1, 1, S::UnsignedInteger,
     C::Samplable | C::Renderable | C::Multisample | COPY | C::Stencil},
    {F::Depth16Unorm, "depth16unorm", 1, 1, 2, S::Depth,
     C::Samplable | C::Renderable | C::Multisample | COPY | C::Depth},
    {F::Depth24Plus, "depth24plus", 1, 1, 0, S::Depth, C::Samplable | C::Renderable | C::Multisample | C::Depth},
    {F::Depth24PlusStencil8, "depth24plus-stencil8", 1, 1, 0, S::Depth,
     C::Samplable | C::Renderable | C::Multisample | C::Depth | C::Stencil},
    {F::Depth32Float, "depth32float", 1, 1, 4, S::Depth,
     C::Samplable | C::Renderable | C::Multisample | C::CopySrc | C::Depth},
    {F::Depth32FloatStencil8, "depth32float-stencil8", 1, 1, 0, S::Depth,
     C::Samplable | C::Renderable | C::Multisample | C::Depth | C::Stencil},

    {F::BC1RgbaUnorm, "bc1-rgba-unorm", 4, 4, 8, S::Float, COMPRESSED},
    {F::BC1RgbaUnormSrgb, "bc1-rgba-unorm-srgb", 4, 4, 8, S::Float, COMPRESSED | C::Srgb},
    {F::BC2RgbaUnorm, "bc2-rgba-unorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::BC2RgbaUnormSrgb, "bc2-rgba-unorm-srgb", 4, 4, 16, S::Float, COMPRESSED | C::Srgb},
    {F::BC3RgbaUnorm, "bc3-rgba-unorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::BC3RgbaUnormSrgb, "bc3-rgba-unorm-srgb", 4, 4, 16, S::Float, COMPRESSED | C::Srgb},
    {F::BC4RUnorm, "bc4-r-unorm", 4, 4, 8, S::Float, COMPRESSED},
    {F::BC4RSnorm, "bc4-r-snorm", 4, 4, 8, S::Float, COMPRESSED},
    {F::BC5RgUnorm, "bc5-rg-unorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::BC5RgSnorm, "bc5-rg-snorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::BC6HRgbUfloat, "bc6h-rgb-ufloat", 4, 4, 16, S::Float, COMPRESSED},
    {F::BC6HRgbFloat, "bc6h-rgb-float", 4, 4, 16, S::Float, COMPRESSED},
    {F::BC7RgbaUnorm, "bc7-rgba-unorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::BC7RgbaUnormSrgb, "bc7-rgba-unorm-srgb", 4, 4, 16, S::Float, COMPRESSED | C::Srgb},

    {F::ETC2Rgb8Unorm, "etc2-rgb8unorm", 4, 4, 8, S::Float, COMPRESSED},
    {F::ETC2Rgb8UnormSrgb, "etc2-rgb8unorm-srgb", 4, 4, 8, S::Float, COMPRESSED | C::Srgb},
    {F::ETC2Rgb8A1Unorm, "etc2-rgb8a1unorm", 4, 4, 8, S::Float, COMPRESSED},
    {F::ETC2Rgb8A1UnormSrgb, "etc2-rgb8a1unorm-srgb", 4, 4, 8, S::Float, COMPRESSED | C::Srgb},
    {F::ETC2Rgba8Unorm, "etc2-rgba8unorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::ETC2Rgba8UnormSrgb, "etc2-rgba8unorm-srgb", 4, 4, 16, S::Float, COMPRESSED | C::Srgb},
    {F::EACR11Unorm, "eac-r11unorm", 4, 4, 8, S::Float, COMPRESSED},
    {F::EACR11Snorm, "eac-r11snorm", 4, 4, 8, S::Float, COMPRESSED},
    {F::EACRg11Unorm, "eac-rg11unorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::EACRg11Snorm, "eac-rg11snorm", 4, 4, 16, S::Float, COMPRESSED},

    {F::ASTC4x4Unorm, "astc-4x4-unorm", 4, 4, 16, S::Float, COMPRESSED},
    {F::ASTC4x4UnormSrgb, "astc-4x4-unorm-srgb", 4, 4, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC5x4Unorm, "astc-5x4-unorm", 5, 4, 16, S::Float, COMPRESSED},
    {F::ASTC5x4UnormSrgb, "astc-5x4-unorm-srgb", 5, 4, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC5x5Unorm, "astc-5x5-unorm", 5, 5, 16, S::Float, COMPRESSED},
    {F::ASTC5x5UnormSrgb, "astc-5x5-unorm-srgb", 5, 5, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC6x5Unorm, "astc-6x5-unorm", 6, 5, 16, S::Float, COMPRESSED},
    {F::ASTC6x5UnormSrgb, "astc-6x5-unorm-srgb", 6, 5, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC6x6Unorm, "astc-6x6-unorm", 6, 6, 16, S::Float, COMPRESSED},
    {F::ASTC6x6UnormSrgb, "astc-6x6-unorm-srgb", 6, 6, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC8x5Unorm, "astc-8x5-unorm", 8, 5, 16, S::Float, COMPRESSED},
    {F::ASTC8x5UnormSrgb, "astc-8x5-unorm-srgb", 8, 5, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC8x6Unorm, "astc-8x6-unorm", 8, 6, 16, S::Float, COMPRESSED},
    {F::ASTC8x6UnormSrgb, "astc-8x6-unorm-srgb", 8, 6, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC8x8Unorm, "astc-8x8-unorm", 8, 8, 16, S::Float, COMPRESSED},
    {F::ASTC8x8UnormSrgb, "astc-8x8-unorm-srgb", 8, 8, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC10x5Unorm, "astc-10x5-unorm", 10, 5, 16, S::Float, COMPRESSED},
    {F::ASTC10x5UnormSrgb, "astc-10x5-unorm-srgb", 10, 5, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC10x6Unorm, "astc-10x6-unorm", 10, 6, 16, S::Float, COMPRESSED},
    {F::ASTC10x6UnormSrgb, "astc-10x6-unorm-srgb", 10, 6, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC10x8Unorm, "astc-10x8-unorm", 10, 8, 16, S::Float, COMPRESSED},
    {F::ASTC10x8UnormSrgb, "astc-10x8-unorm-srgb", 10, 8, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC10x10Unorm, "astc-10x10-unorm", 10, 10, 16, S::Float, COMPRESSED},
    {F::ASTC10x10UnormSrgb, "astc-10x10-unorm-srgb", 10, 10, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC12x10Unorm, "astc-12x10-unorm", 12, 10, 16, S::Float, COMPRESSED},
    {F::ASTC12x10UnormSrgb, "astc-12x10-unorm-srgb", 12, 10, 16, S::Float, COMPRESSED | C::Srgb},
    {F::ASTC12x12Unorm, "astc-12x12-unorm", 12, 12, 16, S::Float, COMPRESSED},
    {F::ASTC12x12UnormSrgb, "astc-12x12-unorm-srgb", 12, 12, 16, S::Float, COMPRESSED | C::Srgb},
}};

constexpr bool table_is_ordered() {
    for (uint32_t i = 0; i < TEXTURE_FORMAT_COUNT; ++i) {
        if (static_cast<uint32_t>(FORMAT_TABLE[i].format) != i) {
            return false;
        }
    }
    return true;
}

static_assert(table_is_ordered(), "format table must be indexed by TextureFormat");

}  // namespace

const FormatInfo& format_info(TextureFormat format) {
    auto index = static_cast<uint32_t>(format);
    GPUBIND_ASSERT(index < TEXTURE_FORMAT_COUNT, "invalid texture format value {}", index);
    return FORMAT_TABLE[index];
}

std::string_view to_string(TextureFormat format) {
    return format_info(format).name;
}

TextureFormat linear_variant(TextureFormat format) {
    // Every srgb format directly follows its linear counterpart in the enumeration
    if (format_info(format).is_srgb()) {
        return static_cast<TextureFormat>(static_cast<uint32_t>(format) - 1);
    }
    return format;
}

bool is_copy_compatible(TextureFormat a, TextureFormat b) {
    return linear_variant(a) == linear_variant(b);
}

}  // namespace gpubind::format
