// GpuBind Graphics Layer
// buffer_resource.hpp - Shared backing of a buffer and every view, binding and command that references it

#pragma once

#include "map_context.hpp"
#include "map_future.hpp"

#include <gpubind/driver/driver.hpp>

#include <memory>
#include <mutex>

namespace gpubind::graphics::detail {

class BufferResource : public std::enable_shared_from_this<BufferResource> {
public:
    BufferResource(std::shared_ptr<driver::Device> device, std::shared_ptr<driver::Buffer> buffer,
                   bool mapped_at_creation);

    BufferResource(const BufferResource&) = delete;
    BufferResource& operator=(const BufferResource&) = delete;

    // Process-unique, used by encoders to detect redundant rebinding
    [[nodiscard]] uint64_t id() const { return id_; }
    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] driver::BufferUsage usage() const { return usage_; }

    [[nodiscard]] driver::Buffer& handle() const { return *buffer_; }
    [[nodiscard]] const std::shared_ptr<driver::Device>& device() const { return device_; }

    [[nodiscard]] MapFuture map_async(driver::MapMode mode, ByteRange range);
    void unmap();

    // Registers a guard range and returns host access to it
    [[nodiscard]] std::unique_ptr<driver::MappedRange> acquire(ByteRange range, bool writable);
    void release(ByteRange range);

    [[nodiscard]] bool is_mapped() const;

private:
    void finish_map(uint64_t generation, driver::MapStatus status);

    std::shared_ptr<driver::Device> device_;
    std::shared_ptr<driver::Buffer> buffer_;
    uint64_t id_;
    size_t size_;
    driver::BufferUsage usage_;

    mutable std::mutex mutex_;
    MapContext map_context_;
};

}  // namespace gpubind::graphics::detail
