// GpuBind Graphics Layer
// bind_group.cpp - Bind group validation

#include <gpubind/graphics/bind_group.hpp>

#include <gpubind/core/assert.hpp>

#include <algorithm>
#include <atomic>

namespace gpubind::graphics {

namespace {

uint64_t next_bind_group_id() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

bool resource_matches(const driver::BindingType& type, const BindingResource& resource) {
    if (const auto* buffer = std::get_if<driver::BufferBindingLayout>(&type)) {
        const auto* binding = std::get_if<BufferBinding>(&resource);
        return binding != nullptr && binding->type == buffer->type;
    }
    if (std::holds_alternative<driver::SamplerBindingLayout>(type)) {
        return std::holds_alternative<Sampler>(resource);
    }
    return std::holds_alternative<TextureView>(resource);
}

}  // namespace

BindGroup::BindGroup(std::shared_ptr<driver::BindGroup> handle, BindGroupLayout layout,
                     std::vector<std::shared_ptr<const void>> retained)
    : shared_(std::make_shared<const Shared>(Shared{std::move(handle), std::move(retained)})),
      layout_(std::move(layout)),
      id_(next_bind_group_id()) {}

namespace detail {

void validate_bind_group_entries(const BindGroupLayout& layout, const std::vector<BindGroupEntry>& entries) {
    const auto& layout_entries = layout.entries();
    GPUBIND_ASSERT(entries.size() == layout_entries.size(), "bind group has {} entries but its layout has {}",
                   entries.size(), layout_entries.size());

    for (const auto& entry : entries) {
        auto it = std::find_if(layout_entries.begin(), layout_entries.end(),
                               [&](const driver::BindGroupLayoutEntry& e) { return e.binding == entry.binding; });
        GPUBIND_ASSERT(it != layout_entries.end(), "binding {} is not part of the layout", entry.binding);
        GPUBIND_ASSERT(resource_matches(it->type, entry.resource),
                       "resource for binding {} does not match its layout entry", entry.binding);
    }
}

}  // namespace detail

}  // namespace gpubind::graphics
