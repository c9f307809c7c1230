// GpuBind Graphics Tests
// view_test.cpp - Tests for typed buffer views, projections and bindings

#include <gtest/gtest.h>

#include <gpubind/graphics/buffer.hpp>
#include <gpubind/graphics/device.hpp>

#include <cstddef>
#include <limits>
#include <numeric>
#include <vector>

namespace gpubind::graphics {

namespace {

constexpr auto STAGING = BufferUsage::MapWrite | BufferUsage::CopySrc;
constexpr auto STORAGE = BufferUsage::Storage | BufferUsage::CopyDst;

struct Vec4 {
    float x, y, z, w;
};

struct Light {
    Vec4 position;
    Vec4 color;
    uint32_t enabled;
    uint32_t padding[3];
};

class ViewTest : public ::testing::Test {
protected:
    ViewTest() : device_(Device::create()) {
        values_.resize(10);
        std::iota(values_.begin(), values_.end(), 100u);
    }

    Buffer<uint32_t[], STAGING> make_staging() const {
        return device_.create_slice_buffer<STAGING>(std::span<const uint32_t>(values_));
    }

    Device device_;
    std::vector<uint32_t> values_;
};

// ============================================================================
// Indexing
// ============================================================================

TEST_F(ViewTest, GetIndex) {
    auto buffer = make_staging();

    auto element = buffer.get(3);
    ASSERT_TRUE(element.has_value());
    EXPECT_EQ(element->offset(), 3 * sizeof(uint32_t));
    EXPECT_EQ(element->id(), buffer.id());

    EXPECT_FALSE(buffer.get(10).has_value());
}

TEST_F(ViewTest, GetRanges) {
    auto buffer = make_staging();

    auto middle = buffer.get(Range{2, 5});
    ASSERT_TRUE(middle.has_value());
    EXPECT_EQ(middle->len(), 3u);
    EXPECT_EQ(middle->offset(), 8u);

    EXPECT_EQ(buffer.get(RangeInclusive{2, 5})->len(), 4u);
    EXPECT_EQ(buffer.get(RangeFrom{7})->len(), 3u);
    EXPECT_EQ(buffer.get(RangeTo{4})->len(), 4u);
    EXPECT_EQ(buffer.get(RangeToInclusive{4})->len(), 5u);
    EXPECT_EQ(buffer.get(RangeFull{})->len(), 10u);

    // Empty ranges at the end are valid
    EXPECT_TRUE(buffer.get(Range{10, 10}).has_value());
}

TEST_F(ViewTest, GetRangesOutOfBounds) {
    auto buffer = make_staging();
    EXPECT_FALSE(buffer.get(Range{5, 11}).has_value());
    EXPECT_FALSE(buffer.get(Range{6, 5}).has_value());
    EXPECT_FALSE(buffer.get(RangeInclusive{0, 10}).has_value());
    EXPECT_FALSE(buffer.get(RangeFrom{11}).has_value());
    EXPECT_FALSE(buffer.get(RangeInclusive{0, std::numeric_limits<size_t>::max()}).has_value());
}

TEST_F(ViewTest, NestedSlicesAccumulateOffsets) {
    auto buffer = make_staging();
    auto outer = buffer[Range{2, 8}];
    auto inner = outer[Range{1, 3}];
    EXPECT_EQ(inner.offset(), 3 * sizeof(uint32_t));
    EXPECT_EQ(inner.len(), 2u);
    EXPECT_FALSE(outer.get(Range{0, 7}).has_value());

    auto element = inner[1];
    EXPECT_EQ(element.offset(), 4 * sizeof(uint32_t));
}

TEST_F(ViewTest, GetUncheckedInBounds) {
    auto buffer = make_staging();
    EXPECT_EQ(buffer.get_unchecked(9).offset(), 36u);
    EXPECT_EQ(buffer.get_unchecked(Range{4, 6}).len(), 2u);
}

TEST_F(ViewTest, SliceViewReadsThroughMapping) {
    auto buffer = make_staging();
    ASSERT_TRUE(buffer.map_write().wait().is_ok());

    auto mapped = buffer[Range{4, 6}].mapped();
    ASSERT_EQ(mapped.size(), 2u);
    EXPECT_EQ(mapped[0], 104u);
    EXPECT_EQ(mapped[1], 105u);
}

// ============================================================================
// Projection
// ============================================================================

TEST_F(ViewTest, ProjectionNarrowsToField) {
    Light light{};
    light.enabled = 1;
    light.color.z = 0.5f;
    auto buffer = device_.create_buffer<STAGING>(light);

    auto enabled = buffer.project(GPUBIND_PROJECTION(Light, enabled));
    static_assert(std::is_same_v<decltype(enabled), View<uint32_t, STAGING>>);
    EXPECT_EQ(enabled.offset(), offsetof(Light, enabled));

    ASSERT_TRUE(buffer.map_write().wait().is_ok());
    EXPECT_EQ(*enabled.mapped(), 1u);
}

TEST_F(ViewTest, ProjectionOfNestedStruct) {
    auto buffer = assume_init(device_.create_buffer_uninit<STAGING, Light>());

    auto color = buffer.project(GPUBIND_PROJECTION(Light, color));
    static_assert(std::is_same_v<decltype(color), View<Vec4, STAGING>>);
    EXPECT_EQ(color.offset(), sizeof(Vec4));

    auto blue = color.project(GPUBIND_PROJECTION(Vec4, z));
    EXPECT_EQ(blue.offset(), sizeof(Vec4) + 2 * sizeof(float));
}

// ============================================================================
// Bindings
// ============================================================================

TEST_F(ViewTest, UniformBindingCoversValue) {
    auto buffer = device_.create_buffer<BufferUsage::Uniform>(Light{});
    auto binding = buffer.uniform().binding();
    EXPECT_EQ(binding.offset, 0u);
    EXPECT_EQ(binding.size, sizeof(Light));
    EXPECT_EQ(binding.type, driver::BufferBindingType::Uniform);
}

TEST_F(ViewTest, StorageBindingAccess) {
    auto buffer = device_.create_slice_buffer<STORAGE>(std::span<const uint32_t>(values_));

    auto read_only = buffer.storage();
    EXPECT_EQ(read_only.binding().type, driver::BufferBindingType::ReadOnlyStorage);
    EXPECT_EQ(read_only.binding().size, 40u);

    auto read_write = buffer[Range{2, 4}].storage<StorageAccess::ReadWrite>();
    EXPECT_EQ(read_write.binding().type, driver::BufferBindingType::Storage);
    EXPECT_EQ(read_write.binding().offset, 8u);
    EXPECT_EQ(read_write.binding().size, 8u);
}

TEST_F(ViewTest, BindingKeepsBufferAlive) {
    BufferBinding binding;
    {
        auto buffer = device_.create_buffer<BufferUsage::Uniform>(Light{});
        binding = buffer.uniform();
    }
    ASSERT_NE(binding.resource, nullptr);
    EXPECT_EQ(binding.resource.use_count(), 1);
    EXPECT_EQ(binding.to_driver().size, sizeof(Light));
}

// ============================================================================
// Image Copy Endpoints
// ============================================================================

TEST_F(ViewTest, ImageCopyBufferUsesElementAsBlock) {
    auto texels = device_.create_slice_buffer_uninit<BufferUsage::CopyDst, uint32_t>(64 * 4);
    auto buffer = assume_init(std::move(texels));

    auto endpoint = buffer.image_copy_buffer(ImageCopyBufferLayout{64, 4});
    EXPECT_EQ(endpoint.bytes_per_block(), 4u);
    EXPECT_EQ(endpoint.bytes_per_row(), 256u);
    EXPECT_EQ(endpoint.rows_per_image(), 4u);
}

TEST_F(ViewTest, ImageCopyBufferRawLayout) {
    auto raw = assume_init(device_.create_slice_buffer_uninit<BufferUsage::CopySrc, std::byte>(1024));
    auto endpoint = raw.image_copy_buffer_raw(ImageCopyBufferRawLayout{16, 32, 2});
    EXPECT_EQ(endpoint.bytes_per_row(), 512u);
}

// ============================================================================
// Contract Violations
// ============================================================================

using ViewDeathTest = ViewTest;

TEST_F(ViewDeathTest, IndexOutOfBoundsAborts) {
    auto buffer = make_staging();
    EXPECT_DEATH((void)buffer[10], "index 10 out of bounds for a slice of length 10");
}

TEST_F(ViewDeathTest, RangeOutOfBoundsAborts) {
    auto buffer = make_staging();
    EXPECT_DEATH((void)buffer[Range{4, 12}], "range out of bounds for a slice of length 10");
}

TEST_F(ViewDeathTest, UnalignedImageCopyRowAborts) {
    auto buffer = assume_init(device_.create_slice_buffer_uninit<BufferUsage::CopyDst, uint32_t>(100));
    EXPECT_DEATH((void)buffer.image_copy_buffer(ImageCopyBufferLayout{10, 10}),
                 "bytes per block row \\(4 \\* 10 = 40\\) must be a multiple of `256`");
}

TEST_F(ViewDeathTest, ZeroSizedBindingAborts) {
    auto buffer = device_.create_slice_buffer<STORAGE>(std::span<const uint32_t>(values_));
    EXPECT_DEATH((void)buffer[Range{3, 3}].storage(), "zero-sized buffer");
}

}  // namespace

// ============================================================================
// Static Capabilities
// ============================================================================

template<typename V>
concept HasUniform = requires(const V& view) { view.uniform(); };

template<typename V>
concept HasStorage = requires(const V& view) { view.storage(); };

template<typename V>
concept HasImageCopy = requires(const V& view) { view.image_copy_buffer(ImageCopyBufferLayout{}); };

static_assert(HasUniform<View<uint32_t, BufferUsage::Uniform>>);
static_assert(!HasUniform<View<uint32_t, BufferUsage::Storage>>);
static_assert(HasStorage<View<uint32_t[], BufferUsage::Storage>>);
static_assert(!HasStorage<View<uint32_t[], BufferUsage::Vertex>>);
static_assert(HasImageCopy<View<uint32_t[], BufferUsage::CopyDst>>);
static_assert(!HasImageCopy<View<uint32_t[], BufferUsage::Vertex>>);

// Byte views must name their block size
static_assert(!HasImageCopy<View<std::byte[], BufferUsage::CopyDst>>);

}  // namespace gpubind::graphics
