// GpuBind Graphics Layer
// binding.cpp - Buffer binding construction

#include <gpubind/graphics/binding.hpp>

#include <gpubind/core/assert.hpp>

namespace gpubind::graphics {

BufferBinding make_buffer_binding(std::shared_ptr<detail::BufferResource> resource, size_t offset, size_t size,
                                  driver::BufferBindingType type) {
    GPUBIND_ASSERT(size > 0, "Cannot use zero-sized buffer as a resource binding");
    return BufferBinding{std::move(resource), offset, size, type};
}

}  // namespace gpubind::graphics
