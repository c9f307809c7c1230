// GpuBind Driver Tests
// driver_test.cpp - Tests for backend selection

#include <gtest/gtest.h>

#include <gpubind/core/config.hpp>
#include <gpubind/driver/driver.hpp>
#include <gpubind/driver/host_driver.hpp>

#include <stdexcept>

namespace gpubind::driver {
namespace {

TEST(DriverRegistryTest, HostBackendIsBuiltIn) {
    EXPECT_TRUE(has_backend(host::BACKEND_NAME));

    auto device = create_device({});
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->backend_name(), host::BACKEND_NAME);
}

TEST(DriverRegistryTest, UnknownBackendThrows) {
    DeviceDescriptor desc;
    desc.backend = "no-such-backend";
    EXPECT_FALSE(has_backend(desc.backend));
    EXPECT_THROW((void)create_device(desc), std::runtime_error);
}

TEST(DriverRegistryTest, RegisteredFactoryIsUsed) {
    int calls = 0;
    register_backend("counting", [&calls](const DeviceDescriptor& desc) -> std::shared_ptr<Device> {
        ++calls;
        host::HostDeviceOptions options;
        options.label = desc.label;
        return host::create_host_device(options);
    });
    EXPECT_TRUE(has_backend("counting"));

    DeviceDescriptor desc;
    desc.backend = "counting";
    desc.label = "registered";
    auto device = create_device(desc);

    EXPECT_EQ(calls, 1);
    auto* host_device = dynamic_cast<host::HostDevice*>(device.get());
    ASSERT_NE(host_device, nullptr);
    EXPECT_EQ(host_device->label(), "registered");
}

TEST(DriverRegistryTest, HostMappingModeFromDescriptor) {
    DeviceDescriptor desc;
    desc.mapping_mode = "staged";
    auto device = create_device(desc);

    auto* host_device = dynamic_cast<host::HostDevice*>(device.get());
    ASSERT_NE(host_device, nullptr);
    EXPECT_EQ(host_device->mapping_mode(), host::MappingMode::Staged);
}

TEST(DriverConfigTest, DescriptorFromConfig) {
    core::Config config;
    config.set(core::config_section::DEVICE, core::config_key::MAPPING_MODE, "staged");
    config.set(core::config_section::DEVICE, core::config_key::LABEL, "from-config");

    auto desc = device_descriptor_from_config(config);
    EXPECT_EQ(desc.backend, "host");
    EXPECT_EQ(desc.mapping_mode, "staged");
    EXPECT_EQ(desc.label, "from-config");
}

TEST(BufferUsageTest, MapUsageCombinations) {
    EXPECT_TRUE(is_valid_buffer_usage(BufferUsage::Vertex | BufferUsage::CopyDst));
    EXPECT_TRUE(is_valid_buffer_usage(BufferUsage::MapRead | BufferUsage::CopyDst));
    EXPECT_TRUE(is_valid_buffer_usage(BufferUsage::MapWrite | BufferUsage::CopySrc));
    EXPECT_FALSE(is_valid_buffer_usage(BufferUsage::MapRead | BufferUsage::CopySrc));
    EXPECT_FALSE(is_valid_buffer_usage(BufferUsage::MapWrite | BufferUsage::Vertex));
    EXPECT_FALSE(is_valid_buffer_usage(BufferUsage::MapRead | BufferUsage::MapWrite));
}

}  // namespace
}  // namespace gpubind::driver
