// GpuBind Graphics Layer
// binding.hpp - Buffer ranges prepared for use as a bind group resource

#pragma once

#include "buffer_resource.hpp"

#include <memory>

namespace gpubind::graphics {

enum class StorageAccess : uint8_t {
    Read,
    ReadWrite,
};

// Keeps the buffer alive for as long as a bind group refers to it
struct BufferBinding {
    std::shared_ptr<detail::BufferResource> resource;
    size_t offset = 0;
    size_t size = 0;
    driver::BufferBindingType type = driver::BufferBindingType::Uniform;

    [[nodiscard]] driver::BufferBinding to_driver() const { return {&resource->handle(), offset, size}; }
};

// Fatal for zero-sized ranges
[[nodiscard]] BufferBinding make_buffer_binding(std::shared_ptr<detail::BufferResource> resource, size_t offset,
                                                size_t size, driver::BufferBindingType type);

template<typename T>
class Uniform {
public:
    explicit Uniform(BufferBinding binding) : binding_(std::move(binding)) {}

    [[nodiscard]] const BufferBinding& binding() const { return binding_; }
    operator BufferBinding() const { return binding_; }

private:
    BufferBinding binding_;
};

template<typename T, StorageAccess A>
class Storage {
public:
    static constexpr StorageAccess access = A;

    explicit Storage(BufferBinding binding) : binding_(std::move(binding)) {}

    [[nodiscard]] const BufferBinding& binding() const { return binding_; }
    operator BufferBinding() const { return binding_; }

private:
    BufferBinding binding_;
};

}  // namespace gpubind::graphics
