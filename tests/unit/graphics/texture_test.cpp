// GpuBind Graphics Tests
// texture_test.cpp - Tests for textures, samplers, query sets and bind groups

#include <gtest/gtest.h>

#include <gpubind/graphics/device.hpp>

#include <memory>
#include <optional>

namespace gpubind::graphics {
namespace {

using driver::Extent3D;
using driver::TextureDimension;

class TextureTest : public ::testing::Test {
protected:
    TextureTest() : device_(Device::create()) {}

    Texture make_texture(Extent3D size, TextureFormat format = TextureFormat::RGBA8Unorm,
                         MipmapLevels levels = MipmapLevels::partial(1)) const {
        TextureDescriptor desc;
        desc.size = size;
        desc.format = format;
        desc.mipmap_levels = levels;
        desc.usage = TextureUsage::TextureBinding | TextureUsage::CopyDst | TextureUsage::CopySrc;
        return device_.create_texture(desc);
    }

    Device device_;
};

// ============================================================================
// Mip Levels
// ============================================================================

TEST(MipmapLevelsTest, MaxLevelsFollowLargestDimension) {
    EXPECT_EQ(max_mipmap_levels({256, 256, 1}, TextureDimension::D2), 9u);
    EXPECT_EQ(max_mipmap_levels({256, 64, 1}, TextureDimension::D2), 9u);
    EXPECT_EQ(max_mipmap_levels({255, 1, 1}, TextureDimension::D2), 8u);
    EXPECT_EQ(max_mipmap_levels({1, 1, 1}, TextureDimension::D2), 1u);
    EXPECT_EQ(max_mipmap_levels({16, 16, 64}, TextureDimension::D3), 7u);
    EXPECT_EQ(max_mipmap_levels({1024, 1, 1}, TextureDimension::D1), 1u);

    // Array layers don't count toward 2D mip chains
    EXPECT_EQ(max_mipmap_levels({16, 16, 64}, TextureDimension::D2), 5u);
}

TEST(MipmapLevelsTest, Resolve) {
    EXPECT_EQ(MipmapLevels::complete().resolve({64, 32, 1}, TextureDimension::D2), 7u);
    EXPECT_EQ(MipmapLevels::partial(3).resolve({64, 32, 1}, TextureDimension::D2), 3u);

    // The full chain may be requested explicitly
    EXPECT_EQ(MipmapLevels::partial(7).resolve({64, 32, 1}, TextureDimension::D2), 7u);
}

TEST_F(TextureTest, CompleteMipChain) {
    auto texture = make_texture({128, 32, 1}, TextureFormat::RGBA8Unorm, MipmapLevels::complete());
    EXPECT_EQ(texture.mip_level_count(), 8u);

    EXPECT_EQ(texture.mip_size(0), (Extent3D{128, 32, 1}));
    EXPECT_EQ(texture.mip_size(3), (Extent3D{16, 4, 1}));
    EXPECT_EQ(texture.mip_size(7), (Extent3D{1, 1, 1}));
}

TEST_F(TextureTest, MipSizeKeepsLayersOf2DArrays) {
    auto texture = make_texture({32, 32, 6}, TextureFormat::RGBA8Unorm, MipmapLevels::partial(2));
    EXPECT_EQ(texture.layers(), 6u);
    EXPECT_EQ(texture.mip_size(1), (Extent3D{16, 16, 6}));
}

// ============================================================================
// Views
// ============================================================================

TEST_F(TextureTest, DefaultViewCoversTexture) {
    auto texture = make_texture({64, 16, 1});
    auto view = texture.create_view();
    EXPECT_EQ(view.format(), TextureFormat::RGBA8Unorm);
    EXPECT_EQ(view.width(), 64u);
    EXPECT_EQ(view.height(), 16u);
    EXPECT_EQ(view.sample_count(), 1u);
}

TEST_F(TextureTest, ViewOfMipLevelUsesMipSize) {
    auto texture = make_texture({64, 16, 1}, TextureFormat::RGBA8Unorm, MipmapLevels::complete());
    TextureViewDescriptor desc;
    desc.base_mip_level = 2;
    desc.mip_level_count = 1;
    auto view = texture.create_view(desc);
    EXPECT_EQ(view.width(), 16u);
    EXPECT_EQ(view.height(), 4u);
}

TEST_F(TextureTest, ViewAsDeclaredFormat) {
    TextureDescriptor desc;
    desc.size = {8, 8, 1};
    desc.format = TextureFormat::RGBA8Unorm;
    desc.usage = TextureUsage::TextureBinding;
    desc.view_formats = {TextureFormat::RGBA8UnormSrgb};
    auto texture = device_.create_texture(desc);

    auto srgb = texture.try_view_as(TextureFormat::RGBA8UnormSrgb);
    ASSERT_TRUE(srgb.is_ok());
    EXPECT_EQ(srgb.value().format(), TextureFormat::RGBA8UnormSrgb);

    // The texture's own format is always supported
    EXPECT_TRUE(texture.try_view_as(TextureFormat::RGBA8Unorm).is_ok());
}

TEST_F(TextureTest, ViewAsUndeclaredFormatFails) {
    TextureDescriptor desc;
    desc.size = {8, 8, 1};
    desc.format = TextureFormat::BGRA8Unorm;
    desc.usage = TextureUsage::TextureBinding;
    desc.view_formats = {TextureFormat::BGRA8UnormSrgb};
    auto texture = device_.create_texture(desc);

    auto result = texture.try_view_as(TextureFormat::RGBA8Unorm);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().requested, TextureFormat::RGBA8Unorm);
    EXPECT_EQ(result.error().what(),
              "`rgba8unorm` is not one of the supported formats: `bgra8unorm`, `bgra8unorm-srgb`");
}

// ============================================================================
// Image Copy Endpoints
// ============================================================================

TEST_F(TextureTest, ImageCopyTextureUsesMipSize) {
    auto texture = make_texture({64, 64, 1}, TextureFormat::RGBA8Unorm, MipmapLevels::partial(3));
    auto endpoint = texture.image_copy_texture(2);
    EXPECT_EQ(endpoint.mip_level(), 2u);
    EXPECT_EQ(endpoint.mip_size(), (Extent3D{16, 16, 1}));
    EXPECT_EQ(endpoint.remaining_size(), (ImageCopySize3D{16, 16, 1}));
}

TEST_F(TextureTest, SubImageCopyAtBlockAlignedOrigin) {
    auto texture = make_texture({64, 64, 1}, TextureFormat::BC1RgbaUnorm);
    auto endpoint = texture.sub_image_copy_texture(0, {8, 12, 0});
    EXPECT_EQ(endpoint.origin(), (driver::Origin3D{8, 12, 0}));
    EXPECT_EQ(endpoint.remaining_size(), (ImageCopySize3D{56, 52, 1}));
}

// ============================================================================
// Samplers and Queries
// ============================================================================

TEST_F(TextureTest, SamplerKinds) {
    auto nearest = device_.create_sampler();
    EXPECT_FALSE(nearest.is_filtering());
    EXPECT_FALSE(nearest.is_comparison());

    driver::SamplerDescriptor desc;
    desc.magnification_filter = driver::FilterMode::Linear;
    desc.compare = driver::CompareFunction::Less;
    auto shadow = device_.create_sampler(desc);
    EXPECT_TRUE(shadow.is_filtering());
    EXPECT_TRUE(shadow.is_comparison());
}

TEST_F(TextureTest, QuerySetLen) {
    auto occlusion = device_.create_occlusion_query_set(16);
    EXPECT_EQ(occlusion.len(), 16u);
    EXPECT_EQ(OcclusionQuerySet::type, driver::QueryType::Occlusion);

    auto timestamps = device_.create_timestamp_query_set(MAX_QUERY_SET_LEN - 1);
    EXPECT_EQ(timestamps.len(), MAX_QUERY_SET_LEN - 1);
}

// ============================================================================
// Bind Groups
// ============================================================================

TEST_F(TextureTest, BindGroupRetainsResources) {
    auto layout = device_.create_bind_group_layout({
        {0, driver::ShaderStage::Fragment, driver::TextureBindingLayout{}},
        {1, driver::ShaderStage::Fragment, driver::SamplerBindingLayout{}},
        {2, driver::ShaderStage::Fragment, driver::BufferBindingLayout{}},
    });

    std::weak_ptr<detail::BufferResource> weak_buffer;
    std::optional<BindGroup> group;
    {
        auto texture = make_texture({4, 4, 1});
        auto uniforms = device_.create_buffer<BufferUsage::Uniform>(uint32_t{7});
        weak_buffer = uniforms.resource();

        group = device_.create_bind_group(layout, {
                                                      {0, texture.create_view()},
                                                      {1, device_.create_sampler()},
                                                      {2, uniforms.uniform()},
                                                  });
    }
    EXPECT_FALSE(weak_buffer.expired());
    EXPECT_TRUE(group->layout().is_compatible(layout));

    group.reset();
    EXPECT_TRUE(weak_buffer.expired());
}

TEST_F(TextureTest, BindGroupLayoutCompatibility) {
    std::vector<driver::BindGroupLayoutEntry> entries{
        {0, driver::ShaderStage::Compute, driver::BufferBindingLayout{driver::BufferBindingType::Storage}},
    };
    auto a = device_.create_bind_group_layout(entries);
    auto b = device_.create_bind_group_layout(entries);
    auto c = device_.create_bind_group_layout({
        {0, driver::ShaderStage::Compute, driver::BufferBindingLayout{driver::BufferBindingType::ReadOnlyStorage}},
    });
    EXPECT_TRUE(a.is_compatible(b));
    EXPECT_FALSE(a.is_compatible(c));
}

TEST_F(TextureTest, BindGroupIdsAreUnique) {
    auto layout = device_.create_bind_group_layout({});
    auto a = device_.create_bind_group(layout, {});
    auto b = device_.create_bind_group(layout, {});
    EXPECT_NE(a.id(), b.id());
}

// ============================================================================
// Contract Violations
// ============================================================================

using TextureDeathTest = TextureTest;

TEST_F(TextureDeathTest, TooManyMipLevelsAborts) {
    EXPECT_DEATH((void)make_texture({16, 16, 1}, TextureFormat::RGBA8Unorm, MipmapLevels::partial(6)),
                 "6 mip levels requested but a 16x16x1 texture has at most 5");
}

TEST_F(TextureDeathTest, UnalignedOriginAborts) {
    auto texture = make_texture({64, 64, 1}, TextureFormat::BC1RgbaUnorm);
    EXPECT_DEATH((void)texture.sub_image_copy_texture(0, {2, 4, 0}), "origin \\(2, 4\\) is not aligned to the 4x4 blocks");
}

TEST_F(TextureDeathTest, CompressedSizeMustBeWholeBlocks) {
    EXPECT_DEATH((void)make_texture({6, 8, 1}, TextureFormat::BC1RgbaUnorm), "is not a whole number of");
}

TEST_F(TextureDeathTest, IncompatibleViewFormatAborts) {
    TextureDescriptor desc;
    desc.size = {8, 8, 1};
    desc.view_formats = {TextureFormat::R32Float};
    EXPECT_DEATH((void)device_.create_texture(desc), "is not compatible with");
}

TEST_F(TextureDeathTest, ViewMipRangeOutOfBoundsAborts) {
    auto texture = make_texture({8, 8, 1});
    TextureViewDescriptor desc;
    desc.base_mip_level = 1;
    EXPECT_DEATH((void)texture.create_view(desc), "base mip level 1 out of bounds for 1 levels");
}

TEST_F(TextureDeathTest, QuerySetTooLargeAborts) {
    EXPECT_DEATH((void)device_.create_occlusion_query_set(8192), "query set len must be less than 8192, got 8192");
}

TEST_F(TextureDeathTest, DuplicateBindingAborts) {
    EXPECT_DEATH((void)device_.create_bind_group_layout({
                     {3, driver::ShaderStage::Vertex, driver::BufferBindingLayout{}},
                     {3, driver::ShaderStage::Fragment, driver::SamplerBindingLayout{}},
                 }),
                 "binding 3 is declared twice");
}

TEST_F(TextureDeathTest, BindGroupEntryCountMismatchAborts) {
    auto layout = device_.create_bind_group_layout({
        {0, driver::ShaderStage::Fragment, driver::SamplerBindingLayout{}},
    });
    EXPECT_DEATH((void)device_.create_bind_group(layout, {}), "bind group has 0 entries but its layout has 1");
}

TEST_F(TextureDeathTest, BindGroupResourceKindMismatchAborts) {
    auto layout = device_.create_bind_group_layout({
        {0, driver::ShaderStage::Fragment, driver::SamplerBindingLayout{}},
    });
    auto texture = make_texture({4, 4, 1});
    EXPECT_DEATH((void)device_.create_bind_group(layout, {{0, texture.create_view()}}),
                 "resource for binding 0 does not match its layout entry");
}

TEST_F(TextureDeathTest, AnisotropyRequiresLinearFiltering) {
    driver::SamplerDescriptor desc;
    desc.max_anisotropy = 8;
    EXPECT_DEATH((void)device_.create_sampler(desc), "anisotropic filtering requires linear filters");
}

}  // namespace
}  // namespace gpubind::graphics
