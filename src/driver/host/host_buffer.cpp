// GpuBind Host Backend
// host_buffer.cpp - Host buffer storage and asynchronous mapping

#include "host_impl.hpp"

#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>

#include <algorithm>
#include <cstring>

namespace gpubind::driver::host {

namespace {

// Aliases the buffer storage directly
class DirectMappedRange final : public MappedRange {
public:
    explicit DirectMappedRange(std::span<std::byte> bytes) : bytes_(bytes) {}

    [[nodiscard]] std::span<const std::byte> bytes() const override { return bytes_; }
    [[nodiscard]] std::span<std::byte> bytes_mut() override { return bytes_; }
    void flush() override {}

private:
    std::span<std::byte> bytes_;
};

// Owns a copy of the mapped bytes, written back on flush
class StagedMappedRange final : public MappedRange {
public:
    StagedMappedRange(std::shared_ptr<HostBuffer> owner, size_t offset, std::vector<std::byte> staging, bool writable)
        : owner_(std::move(owner)), offset_(offset), staging_(std::move(staging)), writable_(writable) {}

    [[nodiscard]] std::span<const std::byte> bytes() const override { return staging_; }

    [[nodiscard]] std::span<std::byte> bytes_mut() override {
        GPUBIND_ASSERT(writable_, "staged range was mapped read-only");
        return staging_;
    }

    void flush() override {
        if (writable_) {
            owner_->write_back(offset_, staging_);
        }
    }

private:
    std::shared_ptr<HostBuffer> owner_;
    size_t offset_;
    std::vector<std::byte> staging_;
    bool writable_;
};

}  // namespace

HostBuffer::HostBuffer(std::shared_ptr<HostContext> context, const BufferDescriptor& desc)
    : context_(std::move(context)), usage_(desc.usage), label_(desc.label), storage_(desc.size) {
    if (desc.mapped_at_creation) {
        state_ = MapState::Mapped;
        writable_mapping_ = true;
        map_offset_ = 0;
        map_size_ = desc.size;
    }
}

void HostBuffer::map_async(MapMode mode, size_t offset, size_t size, MapCallback callback) {
    MapStatus early_status = MapStatus::Success;
    uint64_t serial = 0;
    {
        std::lock_guard lock(mutex_);
        const BufferUsage required = mode == MapMode::Read ? BufferUsage::MapRead : BufferUsage::MapWrite;

        if (context_->is_lost()) {
            early_status = MapStatus::DeviceLost;
        } else if (destroyed_) {
            early_status = MapStatus::Destroyed;
        } else if (state_ != MapState::Unmapped) {
            GPUBIND_LOG_ERROR(core::LogCategory::Driver, "Buffer '{}' map requested while already mapped", label_);
            early_status = MapStatus::Aborted;
        } else if (!has_flag(usage_, required) || offset > storage_.size() || size > storage_.size() - offset) {
            GPUBIND_LOG_ERROR(core::LogCategory::Driver, "Buffer '{}' map request [{}, {}) is invalid", label_,
                              offset, offset + size);
            early_status = MapStatus::Unknown;
        } else {
            state_ = MapState::Pending;
            writable_mapping_ = mode == MapMode::Write;
            map_offset_ = offset;
            map_size_ = size;
            serial = ++map_serial_;
        }
    }

    if (early_status != MapStatus::Success) {
        context_->enqueue_completion(
            [callback = std::move(callback), early_status]() { callback(early_status); });
        return;
    }

    std::weak_ptr<HostBuffer> weak_self = weak_from_this();
    context_->enqueue_completion([weak_self, serial, callback = std::move(callback)]() mutable {
        if (auto self = weak_self.lock()) {
            self->complete_map(serial, callback);
        } else {
            callback(MapStatus::Destroyed);
        }
    });
}

void HostBuffer::complete_map(uint64_t serial, MapCallback& callback) {
    MapStatus status = MapStatus::Success;
    {
        std::lock_guard lock(mutex_);
        if (state_ != MapState::Pending || serial != map_serial_) {
            status = MapStatus::Aborted;
        } else if (context_->is_lost()) {
            status = MapStatus::DeviceLost;
            state_ = MapState::Unmapped;
        } else if (destroyed_) {
            status = MapStatus::Destroyed;
            state_ = MapState::Unmapped;
        } else {
            state_ = MapState::Mapped;
        }
    }
    // Callbacks may issue new map requests, so they run outside the lock
    callback(status);
}

std::unique_ptr<MappedRange> HostBuffer::mapped_range(size_t offset, size_t size, bool writable) {
    std::lock_guard lock(mutex_);
    GPUBIND_ASSERT(state_ == MapState::Mapped, "buffer '{}' is not mapped", label_);
    GPUBIND_ASSERT(offset >= map_offset_ && offset + size <= map_offset_ + map_size_,
                   "range [{}, {}) lies outside the mapped range [{}, {})", offset, offset + size, map_offset_,
                   map_offset_ + map_size_);
    GPUBIND_ASSERT(!writable || writable_mapping_, "buffer '{}' is mapped for reading", label_);

    const auto bytes = std::span<std::byte>(storage_).subspan(offset, size);
    if (context_->mapping_mode == MappingMode::Direct) {
        return std::make_unique<DirectMappedRange>(bytes);
    }
    return std::make_unique<StagedMappedRange>(shared_from_this(), offset,
                                               std::vector<std::byte>(bytes.begin(), bytes.end()), writable);
}

void HostBuffer::unmap() {
    std::lock_guard lock(mutex_);
    if (state_ == MapState::Pending) {
        GPUBIND_LOG_DEBUG(core::LogCategory::Driver, "Buffer '{}' unmapped with a map request in flight", label_);
    }
    state_ = MapState::Unmapped;
    writable_mapping_ = false;
}

void HostBuffer::destroy() {
    std::lock_guard lock(mutex_);
    destroyed_ = true;
    if (state_ == MapState::Mapped) {
        state_ = MapState::Unmapped;
    }
}

bool HostBuffer::is_mapped() const {
    std::lock_guard lock(mutex_);
    return state_ != MapState::Unmapped;
}

void HostBuffer::write(size_t offset, std::span<const std::byte> data) {
    std::lock_guard lock(mutex_);
    std::memcpy(storage_.data() + offset, data.data(), data.size());
}

void HostBuffer::copy_from(const HostBuffer& source, size_t source_offset, size_t offset, size_t size) {
    if (&source == this) {
        std::lock_guard lock(mutex_);
        std::memmove(storage_.data() + offset, storage_.data() + source_offset, size);
        return;
    }
    std::scoped_lock lock(mutex_, source.mutex_);
    std::memcpy(storage_.data() + offset, source.storage_.data() + source_offset, size);
}

void HostBuffer::fill_zero(size_t offset, size_t size) {
    std::lock_guard lock(mutex_);
    std::fill_n(storage_.begin() + static_cast<std::ptrdiff_t>(offset), size, std::byte{0});
}

std::vector<std::byte> HostBuffer::read(size_t offset, size_t size) const {
    std::lock_guard lock(mutex_);
    const auto first = storage_.begin() + static_cast<std::ptrdiff_t>(offset);
    return {first, first + static_cast<std::ptrdiff_t>(size)};
}

void HostBuffer::write_back(size_t offset, std::span<const std::byte> data) {
    std::lock_guard lock(mutex_);
    if (state_ != MapState::Mapped) {
        GPUBIND_LOG_WARN(core::LogCategory::Driver, "Buffer '{}' flushed after unmap, write-back dropped", label_);
        return;
    }
    std::memcpy(storage_.data() + offset, data.data(), data.size());
}

}  // namespace gpubind::driver::host
