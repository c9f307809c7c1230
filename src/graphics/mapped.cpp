// GpuBind Graphics Layer
// mapped.cpp - Mapped range guards

#include <gpubind/graphics/mapped.hpp>

namespace gpubind::graphics::detail {

MappedGuard::MappedGuard(std::shared_ptr<BufferResource> resource, ByteRange range, bool writable)
    : resource_(std::move(resource)), range_(range), writable_(writable) {
    mapped_ = resource_->acquire(range_, writable_);
}

MappedGuard::MappedGuard(MappedGuard&& other) noexcept
    : resource_(std::move(other.resource_)),
      range_(other.range_),
      mapped_(std::move(other.mapped_)),
      writable_(other.writable_) {}

MappedGuard::~MappedGuard() {
    if (!resource_) {
        return;
    }
    if (writable_) {
        mapped_->flush();
    }
    mapped_.reset();
    resource_->release(range_);
}

}  // namespace gpubind::graphics::detail
