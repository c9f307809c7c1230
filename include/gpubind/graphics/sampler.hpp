// GpuBind Graphics Layer
// sampler.hpp - Texture sampler handle

#pragma once

#include <gpubind/driver/driver.hpp>

#include <memory>

namespace gpubind::graphics {

class Sampler {
public:
    Sampler(std::shared_ptr<driver::Sampler> handle, const driver::SamplerDescriptor& desc)
        : handle_(std::move(handle)), desc_(desc) {}

    [[nodiscard]] const driver::Sampler& handle() const { return *handle_; }
    [[nodiscard]] const std::shared_ptr<driver::Sampler>& handle_ptr() const { return handle_; }

    [[nodiscard]] bool is_comparison() const { return desc_.compare.has_value(); }
    [[nodiscard]] bool is_filtering() const {
        return desc_.magnification_filter == driver::FilterMode::Linear ||
               desc_.minification_filter == driver::FilterMode::Linear ||
               desc_.mipmap_filter == driver::FilterMode::Linear;
    }

private:
    std::shared_ptr<driver::Sampler> handle_;
    driver::SamplerDescriptor desc_;
};

}  // namespace gpubind::graphics
