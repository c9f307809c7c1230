// GpuBind Graphics Tests
// compute_pass_test.cpp - Tests for the compute pass encoder

#include <gtest/gtest.h>

#include <gpubind/driver/host_driver.hpp>
#include <gpubind/graphics/compute_pass.hpp>
#include <gpubind/graphics/device.hpp>

#include <string_view>
#include <vector>

namespace gpubind::graphics {
namespace {

using driver::host::command_name;
using driver::host::recorded_commands;

constexpr auto STORAGE = BufferUsage::Storage | BufferUsage::CopyDst;

std::vector<std::string_view> command_names(const CommandBuffer& command_buffer) {
    std::vector<std::string_view> names;
    for (const auto& command : recorded_commands(command_buffer.handle())) {
        names.push_back(command_name(command));
    }
    return names;
}

class ComputePassTest : public ::testing::Test {
protected:
    ComputePassTest()
        : device_(Device::create()),
          storage_layout_(device_.create_bind_group_layout({
              {0, driver::ShaderStage::Compute, driver::BufferBindingLayout{driver::BufferBindingType::Storage}},
          })),
          uniform_layout_(device_.create_bind_group_layout({
              {0, driver::ShaderStage::Compute, driver::BufferBindingLayout{driver::BufferBindingType::Uniform}},
          })),
          shader_(device_.create_shader_module({"@compute @workgroup_size(64) fn main() {}", "square"})),
          particles_(assume_init(device_.create_slice_buffer_uninit<STORAGE, float>(256))),
          params_(device_.create_buffer<BufferUsage::Uniform>(uint32_t{256})) {}

    ComputePipeline make_pipeline(std::vector<BindGroupLayout> layouts) const {
        auto layout = device_.create_pipeline_layout(std::move(layouts));
        ComputePipelineDescriptor desc;
        desc.layout = &layout;
        desc.shader_module = &shader_;
        return device_.create_compute_pipeline(desc);
    }

    BindGroup make_storage_group() const {
        return device_.create_bind_group(storage_layout_, {{0, particles_.storage<StorageAccess::ReadWrite>()}});
    }

    BindGroup make_uniform_group() const {
        return device_.create_bind_group(uniform_layout_, {{0, params_.uniform()}});
    }

    Device device_;
    BindGroupLayout storage_layout_;
    BindGroupLayout uniform_layout_;
    ShaderModule shader_;
    Buffer<float[], STORAGE> particles_;
    Buffer<uint32_t, BufferUsage::Uniform> params_;
};

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(ComputePassTest, DispatchAfterPipelineAndBindGroups) {
    auto pipeline = make_pipeline({storage_layout_, uniform_layout_});
    auto storage = make_storage_group();
    auto uniform = make_uniform_group();

    auto command_buffer = device_.create_command_encoder()
                              .begin_compute_pass()
                              .set_pipeline(pipeline)
                              .set_bind_group(0, storage)
                              .set_bind_group(1, uniform)
                              .dispatch_workgroups(4)
                              .end()
                              .finish();

    EXPECT_EQ(command_names(command_buffer),
              (std::vector<std::string_view>{"begin_compute_pass", "set_compute_pipeline", "set_bind_group",
                                             "set_bind_group", "dispatch_workgroups", "end_compute_pass"}));

    const auto& dispatch = std::get<driver::host::command::Dispatch>(recorded_commands(command_buffer.handle())[4]);
    EXPECT_EQ(dispatch.x, 4u);
    EXPECT_EQ(dispatch.y, 1u);
    EXPECT_EQ(dispatch.z, 1u);
}

TEST_F(ComputePassTest, SetBindGroupsBindsConsecutively) {
    auto pipeline = make_pipeline({storage_layout_, uniform_layout_});
    auto storage = make_storage_group();
    auto uniform = make_uniform_group();

    auto command_buffer = device_.create_command_encoder()
                              .begin_compute_pass()
                              .set_bind_groups(storage, uniform)
                              .set_pipeline(pipeline)
                              .dispatch_workgroups(1, 2, 3)
                              .end()
                              .finish();

    const auto& commands = recorded_commands(command_buffer.handle());
    EXPECT_EQ(std::get<driver::host::command::SetBindGroup>(commands[1]).index, 0u);
    EXPECT_EQ(std::get<driver::host::command::SetBindGroup>(commands[2]).index, 1u);
}

TEST_F(ComputePassTest, RedundantStateIsElided) {
    auto pipeline = make_pipeline({storage_layout_});
    auto storage = make_storage_group();

    auto command_buffer = device_.create_command_encoder()
                              .begin_compute_pass()
                              .set_pipeline(pipeline)
                              .set_bind_group(0, storage)
                              .dispatch_workgroups(1)
                              .set_pipeline(pipeline)
                              .set_bind_group(0, storage)
                              .dispatch_workgroups(2)
                              .end()
                              .finish();

    EXPECT_EQ(command_names(command_buffer),
              (std::vector<std::string_view>{"begin_compute_pass", "set_compute_pipeline", "set_bind_group",
                                             "dispatch_workgroups", "dispatch_workgroups", "end_compute_pass"}));
}

TEST_F(ComputePassTest, PipelineWithoutBindGroups) {
    auto pipeline = make_pipeline({});
    auto command_buffer =
        device_.create_command_encoder().begin_compute_pass().set_pipeline(pipeline).dispatch_workgroups(8).end().finish();
    EXPECT_EQ(command_names(command_buffer).size(), 4u);
}

TEST_F(ComputePassTest, DispatchIndirect) {
    auto pipeline = make_pipeline({});
    auto arguments = device_.create_buffer<BufferUsage::Indirect>(driver::DispatchWorkgroups{16, 1, 1});

    auto command_buffer = device_.create_command_encoder()
                              .begin_compute_pass()
                              .set_pipeline(pipeline)
                              .dispatch_workgroups_indirect(arguments.view())
                              .end()
                              .finish();

    const auto& commands = recorded_commands(command_buffer.handle());
    ASSERT_EQ(commands.size(), 4u);
    const auto& indirect = std::get<driver::host::command::DispatchIndirect>(commands[2]);
    EXPECT_EQ(indirect.buffer, &arguments.handle());
    EXPECT_EQ(indirect.offset, 0u);
}

TEST_F(ComputePassTest, EncoderContinuesAfterPass) {
    auto pipeline = make_pipeline({});
    auto command_buffer = device_.create_command_encoder()
                              .clear_buffer(particles_.view())
                              .begin_compute_pass()
                              .set_pipeline(pipeline)
                              .dispatch_workgroups(1)
                              .end()
                              .clear_buffer(particles_[Range{0, 4}])
                              .finish();

    auto names = command_names(command_buffer);
    EXPECT_EQ(names.front(), "clear_buffer");
    EXPECT_EQ(names.back(), "clear_buffer");

    // The pipeline and both clear targets are retained
    EXPECT_EQ(command_buffer.retained_count(), 3u);
}

// ============================================================================
// Contract Violations
// ============================================================================

using ComputePassDeathTest = ComputePassTest;

TEST_F(ComputePassDeathTest, MissingBindGroupAborts) {
    auto pipeline = make_pipeline({storage_layout_});
    EXPECT_DEATH(
        {
            auto pass = device_.create_command_encoder().begin_compute_pass().set_pipeline(pipeline);
            (void)std::move(pass).dispatch_workgroups(1);
        },
        "bind group 0 is not set");
}

TEST_F(ComputePassDeathTest, IncompatibleBindGroupAborts) {
    auto pipeline = make_pipeline({storage_layout_});
    auto uniform = make_uniform_group();
    EXPECT_DEATH(
        {
            auto pass = device_.create_command_encoder().begin_compute_pass().set_pipeline(pipeline).set_bind_group(
                0, uniform);
            (void)std::move(pass).dispatch_workgroups(1);
        },
        "bind group 0 layout is incompatible with the pipeline");
}

}  // namespace

// ============================================================================
// Static Capabilities
// ============================================================================

template<typename E>
concept CanDispatch = requires(E encoder) { std::move(encoder).dispatch_workgroups(1u, 1u, 1u); };

template<typename E>
concept CanDispatchIndirect = requires(E encoder, const View<driver::DispatchWorkgroups, BufferUsage::Indirect>& args) {
    std::move(encoder).dispatch_workgroups_indirect(args);
};

// Dispatching before a pipeline is set does not compile
static_assert(!CanDispatch<ComputePassEncoder<>>);
static_assert(!CanDispatch<ComputePassEncoder<NoPipeline, BindGroupsSet>>);
static_assert(!CanDispatchIndirect<ComputePassEncoder<>>);
static_assert(CanDispatch<ComputePassEncoder<PipelineSet, NoBindGroups>>);
static_assert(CanDispatch<ComputePassEncoder<PipelineSet, BindGroupsSet>>);
static_assert(CanDispatchIndirect<ComputePassEncoder<PipelineSet, NoBindGroups>>);

}  // namespace gpubind::graphics
