// GpuBind Graphics Layer
// render_bundle.cpp - Render bundle ownership

#include <gpubind/graphics/render_bundle.hpp>

namespace gpubind::graphics {

RenderBundle::RenderBundle(std::shared_ptr<driver::RenderBundle> handle, RenderTargetLayout layout,
                           std::vector<std::shared_ptr<const void>> retained)
    : shared_(std::make_shared<const Shared>(Shared{std::move(handle), std::move(retained)})),
      layout_(std::move(layout)) {}

}  // namespace gpubind::graphics
