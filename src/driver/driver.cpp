// GpuBind Driver Contract
// driver.cpp - Backend registry and device factory

#include <gpubind/core/config.hpp>
#include <gpubind/core/logger.hpp>
#include <gpubind/driver/driver.hpp>
#include <gpubind/driver/host_driver.hpp>

#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace gpubind::driver {

namespace {

struct BackendRegistry {
    std::mutex mutex;
    std::map<std::string, DeviceFactory, std::less<>> factories;
};

BackendRegistry& get_registry() {
    static BackendRegistry registry;
    return registry;
}

}  // namespace

void register_backend(std::string name, DeviceFactory factory) {
    auto& registry = get_registry();
    std::lock_guard lock(registry.mutex);
    GPUBIND_LOG_DEBUG(core::LogCategory::Driver, "Registered backend '{}'", name);
    registry.factories[std::move(name)] = std::move(factory);
}

bool has_backend(std::string_view name) {
    if (name == host::BACKEND_NAME) {
        return true;
    }
    auto& registry = get_registry();
    std::lock_guard lock(registry.mutex);
    return registry.factories.find(name) != registry.factories.end();
}

std::shared_ptr<Device> create_device(const DeviceDescriptor& desc) {
    if (desc.backend == host::BACKEND_NAME) {
        host::HostDeviceOptions options;
        options.mapping_mode = host::parse_mapping_mode(desc.mapping_mode);
        options.label = desc.label;
        GPUBIND_LOG_INFO(core::LogCategory::Device, "Creating host device '{}' ({} mapping)", desc.label,
                         desc.mapping_mode);
        return host::create_host_device(options);
    }

    DeviceFactory factory;
    {
        auto& registry = get_registry();
        std::lock_guard lock(registry.mutex);
        auto it = registry.factories.find(desc.backend);
        if (it != registry.factories.end()) {
            factory = it->second;
        }
    }

    if (!factory) {
        GPUBIND_LOG_ERROR(core::LogCategory::Device, "No graphics backend named '{}'", desc.backend);
        throw std::runtime_error("No graphics backend named '" + desc.backend + "'");
    }

    GPUBIND_LOG_INFO(core::LogCategory::Device, "Creating {} device '{}'", desc.backend, desc.label);
    return factory(desc);
}

DeviceDescriptor device_descriptor_from_config(const core::Config& config) {
    auto settings = config.device_settings();
    DeviceDescriptor desc;
    desc.backend = std::move(settings.backend);
    desc.mapping_mode = std::move(settings.mapping_mode);
    desc.label = std::move(settings.label);
    return desc;
}

}  // namespace gpubind::driver
