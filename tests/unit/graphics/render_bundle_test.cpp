// GpuBind Graphics Tests
// render_bundle_test.cpp - Tests for recording and executing render bundles

#include <gtest/gtest.h>

#include <gpubind/driver/host_driver.hpp>
#include <gpubind/graphics/device.hpp>
#include <gpubind/graphics/render_pass.hpp>

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace gpubind::graphics {
namespace {

struct Sprite {
    float x, y, scale, rotation;
};

}  // namespace

template<>
struct VertexLayoutOf<Sprite> {
    static driver::VertexBufferLayout layout() {
        return {sizeof(Sprite),
                driver::VertexStepMode::Instance,
                {{driver::VertexFormat::Float32x2, 0, 0}, {driver::VertexFormat::Float32x2, 8, 1}}};
    }
};

namespace {

using driver::host::command_name;
using driver::host::recorded_commands;

std::vector<std::string_view> bundle_command_names(const RenderBundle& bundle) {
    std::vector<std::string_view> names;
    for (const auto& command : recorded_commands(bundle.handle())) {
        names.push_back(command_name(command));
    }
    return names;
}

class RenderBundleTest : public ::testing::Test {
protected:
    RenderBundleTest()
        : device_(Device::create()),
          shader_(device_.create_shader_module({"@vertex fn vs_main() {} @fragment fn fs_main() {}", "sprites"})),
          layout_(device_.create_pipeline_layout({})),
          pipeline_(make_pipeline(TextureFormat::BGRA8Unorm)),
          sprites_(device_.create_slice_buffer<BufferUsage::Vertex>(std::span<const Sprite>(SPRITES))) {}

    static constexpr std::array<Sprite, 3> SPRITES{{{0, 0, 1, 0}, {4, 4, 2, 0}, {8, 0, 1, 0.5f}}};

    static RenderTargetLayout bgra_layout() { return RenderTargetLayout{{TextureFormat::BGRA8Unorm}, std::nullopt, 1}; }

    RenderPipeline make_pipeline(TextureFormat format) const {
        RenderPipelineDescriptor desc;
        desc.layout = &layout_;
        desc.vertex_module = &shader_;
        desc.vertex_buffer_layouts = vertex_layouts<Sprite>();
        desc.fragment_module = &shader_;
        desc.color_targets = {driver::ColorTargetState{format}};
        return device_.create_render_pipeline(desc);
    }

    Texture make_target(TextureFormat format) const {
        TextureDescriptor desc;
        desc.size = {128, 128, 1};
        desc.format = format;
        desc.usage = TextureUsage::RenderAttachment;
        return device_.create_texture(desc);
    }

    RenderBundle record_sprites() const {
        return device_.create_render_bundle_encoder(bgra_layout())
            .set_pipeline(pipeline_)
            .set_vertex_buffer(0, sprites_)
            .draw(6, 3)
            .finish();
    }

    Device device_;
    ShaderModule shader_;
    PipelineLayout layout_;
    RenderPipeline pipeline_;
    Buffer<Sprite[], BufferUsage::Vertex> sprites_;
};

// ============================================================================
// Recording
// ============================================================================

TEST_F(RenderBundleTest, RecordsDrawCommands) {
    auto bundle = record_sprites();
    EXPECT_EQ(bundle_command_names(bundle),
              (std::vector<std::string_view>{"set_render_pipeline", "set_vertex_buffer", "draw"}));
    EXPECT_EQ(bundle.layout(), bgra_layout());
}

TEST_F(RenderBundleTest, RedundantBindingsAreElided) {
    auto bundle = device_.create_render_bundle_encoder(bgra_layout())
                      .set_pipeline(pipeline_)
                      .set_vertex_buffer(0, sprites_)
                      .draw(6, 1)
                      .set_pipeline(pipeline_)
                      .set_vertex_buffer(0, sprites_)
                      .draw(6, 2, 0, 1)
                      .finish();

    EXPECT_EQ(bundle_command_names(bundle),
              (std::vector<std::string_view>{"set_render_pipeline", "set_vertex_buffer", "draw", "draw"}));
}

TEST_F(RenderBundleTest, BundleKeepsResourcesAlive) {
    std::optional<RenderBundle> bundle;
    std::weak_ptr<detail::BufferResource> instances;
    {
        auto buffer = device_.create_slice_buffer<BufferUsage::Vertex>(std::span<const Sprite>(SPRITES));
        instances = buffer.resource();
        bundle = device_.create_render_bundle_encoder(bgra_layout())
                     .set_pipeline(pipeline_)
                     .set_vertex_buffer(0, buffer)
                     .draw(6, 3)
                     .finish();
    }
    EXPECT_FALSE(instances.expired());

    bundle.reset();
    EXPECT_TRUE(instances.expired());
}

TEST_F(RenderBundleTest, ExecutesInMatchingPass) {
    auto first = record_sprites();
    auto second = record_sprites();
    auto target = make_target(TextureFormat::BGRA8Unorm);

    auto command_buffer =
        device_.create_command_encoder()
            .begin_render_pass(RenderPassDescriptor<>(RenderTarget{{ColorAttachment{target.create_view()}}, std::nullopt}))
            .execute_bundles(first, second)
            .end()
            .finish();

    const auto& commands = recorded_commands(command_buffer.handle());
    ASSERT_EQ(commands.size(), 3u);
    const auto& execute = std::get<driver::host::command::ExecuteBundles>(commands[1]);
    ASSERT_EQ(execute.bundles.size(), 2u);
    EXPECT_EQ(execute.bundles[0], &first.handle());
    EXPECT_EQ(execute.bundles[1], &second.handle());
}

// ============================================================================
// Contract Violations
// ============================================================================

using RenderBundleDeathTest = RenderBundleTest;

TEST_F(RenderBundleDeathTest, EmptyLayoutAborts) {
    EXPECT_DEATH((void)device_.create_render_bundle_encoder(RenderTargetLayout{}),
                 "render bundle layout needs a color or depth-stencil format");
}

TEST_F(RenderBundleDeathTest, IncompatiblePipelineAborts) {
    auto rgba = make_pipeline(TextureFormat::RGBA8Unorm);
    EXPECT_DEATH((void)device_.create_render_bundle_encoder(bgra_layout()).set_pipeline(rgba),
                 "pipeline render target layout is incompatible with the render bundle");
}

TEST_F(RenderBundleDeathTest, DrawWithoutVertexBufferAborts) {
    EXPECT_DEATH((void)device_.create_render_bundle_encoder(bgra_layout()).set_pipeline(pipeline_).draw(6, 3),
                 "vertex buffer 0 is not set");
}

TEST_F(RenderBundleDeathTest, TooManyInstancesAborts) {
    EXPECT_DEATH((void)device_.create_render_bundle_encoder(bgra_layout())
                     .set_pipeline(pipeline_)
                     .set_vertex_buffer(0, sprites_)
                     .draw(6, 2, 0, 2),
                 "draw reads 4 instances from vertex buffer 0 which holds 3");
}

TEST_F(RenderBundleDeathTest, ExecuteInIncompatiblePassAborts) {
    auto bundle = record_sprites();
    auto target = make_target(TextureFormat::RGBA8Unorm);
    EXPECT_DEATH((void)device_.create_command_encoder()
                     .begin_render_pass(
                         RenderPassDescriptor<>(RenderTarget{{ColorAttachment{target.create_view()}}, std::nullopt}))
                     .execute_bundle(bundle),
                 "render bundle layout is incompatible with the render pass");
}

}  // namespace

// ============================================================================
// Static Capabilities
// ============================================================================

template<typename E>
concept CanDraw = requires(E encoder) { std::move(encoder).draw(3u); };

template<typename E>
concept CanDrawIndexed = requires(E encoder) { std::move(encoder).draw_indexed(3u); };

static_assert(!CanDraw<RenderBundleEncoder<>>);
static_assert(CanDraw<RenderBundleEncoder<PipelineSet>>);
static_assert(!CanDrawIndexed<RenderBundleEncoder<PipelineSet>>);
static_assert(CanDrawIndexed<RenderBundleEncoder<PipelineSet, NoVertexBuffers, IndexBufferSet>>);

}  // namespace gpubind::graphics
