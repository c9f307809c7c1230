// GpuBind Graphics Layer
// buffer_resource.cpp - Buffer mapping state machine

#include <gpubind/graphics/buffer_resource.hpp>

#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>

#include <atomic>

namespace gpubind::graphics::detail {

namespace {

uint64_t next_buffer_id() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

}  // namespace

BufferResource::BufferResource(std::shared_ptr<driver::Device> device, std::shared_ptr<driver::Buffer> buffer,
                               bool mapped_at_creation)
    : device_(std::move(device)),
      buffer_(std::move(buffer)),
      id_(next_buffer_id()),
      size_(buffer_->size()),
      usage_(buffer_->usage()),
      map_context_(size_) {
    if (mapped_at_creation) {
        map_context_.begin_mapped(ByteRange{0, size_}, driver::MapMode::Write);
    }
}

MapFuture BufferResource::map_async(driver::MapMode mode, ByteRange range) {
    uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        generation = map_context_.begin_map(range, mode);
    }

    GPUBIND_LOG_DEBUG(core::LogCategory::Buffer, "Buffer {} map requested for {} of [{}, {})", id_,
                      mode == driver::MapMode::Read ? "read" : "write", range.start, range.end);

    auto state = std::make_shared<MapRequestState>();
    std::weak_ptr<BufferResource> weak_self = weak_from_this();
    std::weak_ptr<MapRequestState> weak_state = state;

    buffer_->map_async(mode, range.start, range.size(), [weak_self, weak_state, generation](driver::MapStatus status) {
        if (auto self = weak_self.lock()) {
            self->finish_map(generation, status);
        }
        if (auto request = weak_state.lock()) {
            request->resolve(map_result_from_status(status));
        }
    });

    return MapFuture(device_, std::move(state));
}

void BufferResource::finish_map(uint64_t generation, driver::MapStatus status) {
    std::lock_guard lock(mutex_);
    if (status == driver::MapStatus::Success) {
        map_context_.complete(generation);
        GPUBIND_LOG_DEBUG(core::LogCategory::Buffer, "Buffer {} mapped", id_);
        return;
    }
    map_context_.fail(generation);
    GPUBIND_LOG_WARN(core::LogCategory::Buffer, "Buffer {} map failed: {}", id_,
                     to_string(map_result_from_status(status).error()));
}

void BufferResource::unmap() {
    std::lock_guard lock(mutex_);
    map_context_.reset();
    buffer_->unmap();
}

std::unique_ptr<driver::MappedRange> BufferResource::acquire(ByteRange range, bool writable) {
    std::lock_guard lock(mutex_);
    GPUBIND_ASSERT(map_context_.is_mapped(), "buffer {} is not mapped", id_);
    if (writable) {
        GPUBIND_ASSERT(map_context_.mode() == driver::MapMode::Write,
                       "cannot mutably access a buffer that was mapped for reading");
    }
    map_context_.add(range);
    return buffer_->mapped_range(range.start, range.size(), writable);
}

void BufferResource::release(ByteRange range) {
    std::lock_guard lock(mutex_);
    map_context_.remove(range);
}

bool BufferResource::is_mapped() const {
    std::lock_guard lock(mutex_);
    return map_context_.is_mapped();
}

}  // namespace gpubind::graphics::detail
