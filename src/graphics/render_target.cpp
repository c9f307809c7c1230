// GpuBind Graphics Layer
// render_target.cpp - Render target validation

#include <gpubind/graphics/render_target.hpp>

#include <gpubind/core/assert.hpp>

namespace gpubind::graphics {

RenderTargetLayout RenderTarget::layout() const {
    RenderTargetLayout layout;
    for (const auto& attachment : color_attachments) {
        layout.color_formats.push_back(attachment.view.format());
        layout.sample_count = attachment.view.sample_count();
    }
    if (depth_stencil.has_value()) {
        layout.depth_stencil_format = depth_stencil->view.format();
        layout.sample_count = depth_stencil->view.sample_count();
    }
    return layout;
}

namespace detail {

namespace {

void validate_attachment(const TextureView& view, uint32_t width, uint32_t height, uint32_t sample_count) {
    GPUBIND_ASSERT(has_flag(view.usage(), TextureUsage::RenderAttachment),
                   "attachment texture was not created with the RenderAttachment usage");
    GPUBIND_ASSERT(view.width() == width && view.height() == height,
                   "all attachment dimensions must match: {}x{} and {}x{}", width, height, view.width(),
                   view.height());
    GPUBIND_ASSERT(view.sample_count() == sample_count, "all attachments must have the same sample count");
}

}  // namespace

void validate_render_target(const RenderTarget& target) {
    const TextureView* first = nullptr;
    if (!target.color_attachments.empty()) {
        first = &target.color_attachments.front().view;
    } else if (target.depth_stencil.has_value()) {
        first = &target.depth_stencil->view;
    }
    GPUBIND_ASSERT(first != nullptr,
                   "target must specify either at least 1 color attachment or a depth-stencil attachment");

    for (const auto& attachment : target.color_attachments) {
        validate_attachment(attachment.view, first->width(), first->height(), first->sample_count());
        if (attachment.resolve_target.has_value()) {
            const auto& resolve = *attachment.resolve_target;
            GPUBIND_ASSERT(attachment.view.sample_count() > 1, "resolve target requires a multisampled attachment");
            GPUBIND_ASSERT(resolve.sample_count() == 1, "resolve target must not be multisampled");
            GPUBIND_ASSERT(resolve.width() == first->width() && resolve.height() == first->height(),
                           "all attachment dimensions must match: {}x{} and {}x{}", first->width(),
                           first->height(), resolve.width(), resolve.height());
            GPUBIND_ASSERT(resolve.format() == attachment.view.format(),
                           "resolve target format must match its attachment");
        }
    }
    if (target.depth_stencil.has_value()) {
        validate_attachment(target.depth_stencil->view, first->width(), first->height(), first->sample_count());
    }
}

driver::RenderPassDescriptor to_driver(const RenderTarget& target, const driver::QuerySet* occlusion_query_set) {
    driver::RenderPassDescriptor desc;
    desc.color_attachments.reserve(target.color_attachments.size());
    for (const auto& attachment : target.color_attachments) {
        driver::RenderPassColorAttachment color;
        color.view = &attachment.view.handle();
        color.resolve_target = attachment.resolve_target.has_value() ? &attachment.resolve_target->handle() : nullptr;
        color.load_op = attachment.load_op;
        color.store_op = attachment.store_op;
        color.clear_value = attachment.clear_value;
        desc.color_attachments.push_back(color);
    }
    if (target.depth_stencil.has_value()) {
        driver::RenderPassDepthStencilAttachment depth_stencil;
        depth_stencil.view = &target.depth_stencil->view.handle();
        depth_stencil.depth_operations = target.depth_stencil->depth_operations;
        depth_stencil.stencil_operations = target.depth_stencil->stencil_operations;
        desc.depth_stencil_attachment = depth_stencil;
    }
    desc.occlusion_query_set = occlusion_query_set;
    return desc;
}

}  // namespace detail

}  // namespace gpubind::graphics
