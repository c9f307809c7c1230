// GpuBind Driver Tests
// host_driver_test.cpp - Tests for the in-process reference backend

#include <gtest/gtest.h>

#include <gpubind/driver/host_driver.hpp>

#include <cstring>
#include <optional>

namespace gpubind::driver::host {
namespace {

class HostDriverTest : public ::testing::TestWithParam<MappingMode> {
protected:
    void SetUp() override {
        HostDeviceOptions options;
        options.mapping_mode = GetParam();
        device_ = create_host_device(options);
    }

    std::shared_ptr<Buffer> make_buffer(size_t size, BufferUsage usage, bool mapped_at_creation = false) {
        BufferDescriptor desc;
        desc.size = size;
        desc.usage = usage;
        desc.mapped_at_creation = mapped_at_creation;
        return device_->create_buffer(desc);
    }

    std::optional<MapStatus> map_and_poll(Buffer& buffer, MapMode mode, size_t offset, size_t size) {
        std::optional<MapStatus> status;
        buffer.map_async(mode, offset, size, [&status](MapStatus result) { status = result; });
        EXPECT_FALSE(status.has_value()) << "map callbacks only run from poll()";
        while (device_->poll()) {
        }
        return status;
    }

    std::shared_ptr<HostDevice> device_;
};

TEST_P(HostDriverTest, MappedAtCreationWritesAreVisibleAfterMapRead) {
    auto buffer = make_buffer(16, BufferUsage::MapRead | BufferUsage::CopyDst, true);
    {
        auto range = buffer->mapped_range(0, 16, true);
        const uint32_t values[4] = {1, 2, 3, 4};
        std::memcpy(range->bytes_mut().data(), values, sizeof(values));
        range->flush();
    }
    buffer->unmap();

    auto status = map_and_poll(*buffer, MapMode::Read, 0, 16);
    ASSERT_EQ(status, MapStatus::Success);

    auto range = buffer->mapped_range(4, 8, false);
    uint32_t read[2] = {};
    std::memcpy(read, range->bytes().data(), sizeof(read));
    EXPECT_EQ(read[0], 2u);
    EXPECT_EQ(read[1], 3u);
}

TEST_P(HostDriverTest, MapWithoutUsageFails) {
    auto buffer = make_buffer(16, BufferUsage::Vertex);
    EXPECT_EQ(map_and_poll(*buffer, MapMode::Read, 0, 16), MapStatus::Unknown);
}

TEST_P(HostDriverTest, DestroyedBufferFailsMap) {
    auto buffer = make_buffer(16, BufferUsage::MapRead | BufferUsage::CopyDst);
    buffer->destroy();
    EXPECT_EQ(map_and_poll(*buffer, MapMode::Read, 0, 16), MapStatus::Destroyed);
}

TEST_P(HostDriverTest, DeviceLossFailsMap) {
    auto buffer = make_buffer(16, BufferUsage::MapWrite | BufferUsage::CopySrc);
    device_->simulate_device_loss();
    EXPECT_TRUE(device_->is_lost());
    EXPECT_EQ(map_and_poll(*buffer, MapMode::Write, 0, 16), MapStatus::DeviceLost);
}

TEST_P(HostDriverTest, DeviceLossWhilePendingFailsMap) {
    auto buffer = make_buffer(16, BufferUsage::MapRead | BufferUsage::CopyDst);
    std::optional<MapStatus> status;
    buffer->map_async(MapMode::Read, 0, 16, [&status](MapStatus result) { status = result; });
    device_->simulate_device_loss();
    while (device_->poll()) {
    }
    EXPECT_EQ(status, MapStatus::DeviceLost);
}

TEST_P(HostDriverTest, RecordsEncodedCommands) {
    auto source = make_buffer(16, BufferUsage::CopySrc);
    auto destination = make_buffer(16, BufferUsage::CopyDst);

    auto encoder = device_->create_command_encoder();
    encoder->copy_buffer_to_buffer({source.get(), 0, destination.get(), 0, 16});
    encoder->clear_buffer({destination.get(), 8, 8});
    auto command_buffer = encoder->finish();

    const auto& commands = recorded_commands(*command_buffer);
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(command_name(commands[0]), "copy_buffer_to_buffer");
    EXPECT_EQ(command_name(commands[1]), "clear_buffer");
}

TEST_P(HostDriverTest, SubmitCountsCommandBuffers) {
    auto encoder = device_->create_command_encoder();
    auto command_buffer = encoder->finish();
    device_->queue().submit(*command_buffer);
    device_->queue().submit(*command_buffer);
    EXPECT_EQ(device_->submitted_command_buffer_count(), 2u);
}

INSTANTIATE_TEST_SUITE_P(MappingModes, HostDriverTest, ::testing::Values(MappingMode::Direct, MappingMode::Staged),
                         [](const ::testing::TestParamInfo<MappingMode>& info) {
                             return std::string(to_string(info.param)) == "staged" ? "Staged" : "Direct";
                         });

TEST(HostMappingModeTest, ParsesNames) {
    EXPECT_EQ(parse_mapping_mode("direct"), MappingMode::Direct);
    EXPECT_EQ(parse_mapping_mode("staged"), MappingMode::Staged);
    EXPECT_EQ(parse_mapping_mode("unknown"), MappingMode::Direct);
}

TEST(HostMappingModeTest, StagedWritesLandOnFlush) {
    HostDeviceOptions options;
    options.mapping_mode = MappingMode::Staged;
    auto device = create_host_device(options);

    BufferDescriptor desc;
    desc.size = 8;
    desc.usage = BufferUsage::MapRead | BufferUsage::CopyDst;
    desc.mapped_at_creation = true;
    auto buffer = device->create_buffer(desc);

    auto writer = buffer->mapped_range(0, 8, true);
    writer->bytes_mut()[0] = std::byte{0x2A};

    // The staging copy is private until flushed
    auto before = buffer->mapped_range(0, 8, false);
    EXPECT_EQ(before->bytes()[0], std::byte{0});

    writer->flush();
    auto after = buffer->mapped_range(0, 8, false);
    EXPECT_EQ(after->bytes()[0], std::byte{0x2A});
}

}  // namespace
}  // namespace gpubind::driver::host
