// GpuBind Graphics Layer
// bind_group.hpp - Bind group layouts and bind groups

#pragma once

#include "binding.hpp"
#include "sampler.hpp"
#include "texture.hpp"

#include <memory>
#include <variant>
#include <vector>

namespace gpubind::graphics {

class BindGroupLayout {
public:
    BindGroupLayout(std::shared_ptr<driver::BindGroupLayout> handle, std::vector<driver::BindGroupLayoutEntry> entries)
        : handle_(std::move(handle)), entries_(std::move(entries)) {}

    [[nodiscard]] const driver::BindGroupLayout& handle() const { return *handle_; }
    [[nodiscard]] const std::vector<driver::BindGroupLayoutEntry>& entries() const { return entries_; }

    // Layouts are interchangeable when their entries are equal
    [[nodiscard]] bool is_compatible(const BindGroupLayout& other) const { return entries_ == other.entries_; }

private:
    std::shared_ptr<driver::BindGroupLayout> handle_;
    std::vector<driver::BindGroupLayoutEntry> entries_;
};

using BindingResource = std::variant<BufferBinding, TextureView, Sampler>;

struct BindGroupEntry {
    uint32_t binding = 0;
    BindingResource resource;
};

// Retains every buffer, texture and sampler it references
class BindGroup {
public:
    BindGroup(std::shared_ptr<driver::BindGroup> handle, BindGroupLayout layout,
              std::vector<std::shared_ptr<const void>> retained);

    [[nodiscard]] uint64_t id() const { return id_; }
    [[nodiscard]] const driver::BindGroup& handle() const { return *shared_->handle; }
    [[nodiscard]] const BindGroupLayout& layout() const { return layout_; }

    // Keeps the driver bind group and everything it references alive
    [[nodiscard]] std::shared_ptr<const void> keep_alive() const { return shared_; }

private:
    struct Shared {
        std::shared_ptr<driver::BindGroup> handle;
        std::vector<std::shared_ptr<const void>> retained;
    };

    std::shared_ptr<const Shared> shared_;
    BindGroupLayout layout_;
    uint64_t id_;
};

namespace detail {

// Fatal when an entry has no matching layout entry or the resource kind differs
void validate_bind_group_entries(const BindGroupLayout& layout, const std::vector<BindGroupEntry>& entries);

}  // namespace detail

}  // namespace gpubind::graphics
