// GpuBind Format Tests
// texture_format_test.cpp - Tests for the texture format capability table

#include <gtest/gtest.h>

#include <gpubind/format/texture_format.hpp>

namespace gpubind::format {
namespace {

// ============================================================================
// Table Integrity
// ============================================================================

TEST(TextureFormatTest, EveryFormatHasEntry) {
    for (uint32_t i = 0; i < TEXTURE_FORMAT_COUNT; ++i) {
        auto format = static_cast<TextureFormat>(i);
        const auto& info = format_info(format);
        EXPECT_EQ(info.format, format);
        EXPECT_FALSE(info.name.empty());
        EXPECT_GE(info.block_width, 1u);
        EXPECT_GE(info.block_height, 1u);
    }
}

TEST(TextureFormatTest, CompressedFormatsUseBlocks) {
    for (uint32_t i = 0; i < TEXTURE_FORMAT_COUNT; ++i) {
        const auto& info = format_info(static_cast<TextureFormat>(i));
        if (info.is_compressed()) {
            EXPECT_GT(info.block_width * info.block_height, 1u) << info.name;
            EXPECT_FALSE(info.is_renderable()) << info.name;
        } else {
            EXPECT_EQ(info.block_width, 1u) << info.name;
            EXPECT_EQ(info.block_height, 1u) << info.name;
        }
    }
}

TEST(TextureFormatTest, SrgbFormatsHaveLinearVariant) {
    for (uint32_t i = 0; i < TEXTURE_FORMAT_COUNT; ++i) {
        auto format = static_cast<TextureFormat>(i);
        auto linear = linear_variant(format);
        EXPECT_FALSE(format_info(linear).is_srgb()) << to_string(format);
        if (format_info(format).is_srgb()) {
            EXPECT_NE(linear, format);
            EXPECT_EQ(format_info(linear).block_width, format_info(format).block_width);
            EXPECT_EQ(format_info(linear).bytes_per_block, format_info(format).bytes_per_block);
        }
    }
}

// ============================================================================
// Individual Formats
// ============================================================================

TEST(TextureFormatTest, Rgba8Unorm) {
    const auto& info = format_info(TextureFormat::RGBA8Unorm);
    EXPECT_EQ(info.name, "rgba8unorm");
    EXPECT_EQ(info.bytes_per_block, 4u);
    EXPECT_EQ(info.sample_type, SampleType::Float);
    EXPECT_TRUE(info.is_renderable());
    EXPECT_TRUE(info.is_blendable());
    EXPECT_TRUE(info.is_storable());
    EXPECT_TRUE(info.is_filterable());
    EXPECT_FALSE(info.is_srgb());
}

TEST(TextureFormatTest, IntegerFormatsAreNotFilterable) {
    const auto& info = format_info(TextureFormat::R32Uint);
    EXPECT_EQ(info.sample_type, SampleType::UnsignedInteger);
    EXPECT_TRUE(info.is_samplable());
    EXPECT_FALSE(info.is_filterable());
    EXPECT_FALSE(info.is_blendable());
}

TEST(TextureFormatTest, DepthFormats) {
    const auto& depth = format_info(TextureFormat::Depth32Float);
    EXPECT_TRUE(depth.has_depth());
    EXPECT_FALSE(depth.has_stencil());
    EXPECT_TRUE(depth.is_copy_src());
    EXPECT_FALSE(depth.is_copy_dst());

    const auto& combined = format_info(TextureFormat::Depth24PlusStencil8);
    EXPECT_TRUE(combined.has_depth());
    EXPECT_TRUE(combined.has_stencil());
    EXPECT_EQ(combined.bytes_per_block, 0u);
}

TEST(TextureFormatTest, AstcBlockSizes) {
    const auto& info = format_info(TextureFormat::ASTC10x6UnormSrgb);
    EXPECT_EQ(info.block_width, 10u);
    EXPECT_EQ(info.block_height, 6u);
    EXPECT_EQ(info.bytes_per_block, 16u);
    EXPECT_TRUE(info.is_srgb());
    EXPECT_EQ(to_string(TextureFormat::ASTC10x6UnormSrgb), "astc-10x6-unorm-srgb");
}

TEST(TextureFormatTest, Bc1HalfByteTexels) {
    const auto& info = format_info(TextureFormat::BC1RgbaUnorm);
    EXPECT_EQ(info.block_width, 4u);
    EXPECT_EQ(info.bytes_per_block, 8u);
}

// ============================================================================
// Copy Compatibility
// ============================================================================

TEST(TextureFormatTest, CopyCompatibleIgnoresSrgb) {
    EXPECT_TRUE(is_copy_compatible(TextureFormat::RGBA8Unorm, TextureFormat::RGBA8UnormSrgb));
    EXPECT_TRUE(is_copy_compatible(TextureFormat::BGRA8UnormSrgb, TextureFormat::BGRA8Unorm));
    EXPECT_TRUE(is_copy_compatible(TextureFormat::R32Float, TextureFormat::R32Float));
    EXPECT_FALSE(is_copy_compatible(TextureFormat::RGBA8Unorm, TextureFormat::BGRA8Unorm));
    EXPECT_FALSE(is_copy_compatible(TextureFormat::R32Float, TextureFormat::R32Uint));
}

TEST(TextureFormatTest, LinearVariant) {
    EXPECT_EQ(linear_variant(TextureFormat::BC7RgbaUnormSrgb), TextureFormat::BC7RgbaUnorm);
    EXPECT_EQ(linear_variant(TextureFormat::RGBA16Float), TextureFormat::RGBA16Float);
}

}  // namespace
}  // namespace gpubind::format
