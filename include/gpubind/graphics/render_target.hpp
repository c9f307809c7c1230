// GpuBind Graphics Layer
// render_target.hpp - Render pass attachments and descriptors

#pragma once

#include "encoder_state.hpp"
#include "pipeline.hpp"
#include "query_set.hpp"
#include "texture.hpp"

#include <glm/vec4.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace gpubind::graphics {

struct ColorAttachment {
    TextureView view;
    std::optional<TextureView> resolve_target;
    driver::LoadOp load_op = driver::LoadOp::Clear;
    driver::StoreOp store_op = driver::StoreOp::Store;
    glm::dvec4 clear_value{0.0, 0.0, 0.0, 1.0};
};

struct DepthStencilAttachment {
    TextureView view;
    std::optional<driver::DepthStencilOperations<float>> depth_operations;
    std::optional<driver::DepthStencilOperations<uint32_t>> stencil_operations;
};

struct RenderTarget {
    std::vector<ColorAttachment> color_attachments;
    std::optional<DepthStencilAttachment> depth_stencil;

    [[nodiscard]] RenderTargetLayout layout() const;
};

namespace detail {

// Fatal for empty targets and attachments of differing size
void validate_render_target(const RenderTarget& target);

// The driver descriptor points into the target, which must outlive it
[[nodiscard]] driver::RenderPassDescriptor to_driver(const RenderTarget& target,
                                                     const driver::QuerySet* occlusion_query_set);

}  // namespace detail

template<OcclusionQueryState Q = NoOcclusionQuery>
class RenderPassDescriptor {
public:
    explicit RenderPassDescriptor(RenderTarget target)
        requires std::same_as<Q, NoOcclusionQuery>
        : target_(std::move(target)) {
        detail::validate_render_target(target_);
    }

    // Enables begin_occlusion_query on the pass
    [[nodiscard]] RenderPassDescriptor<OcclusionQueryNotStarted> occlusion_query_set(
        const OcclusionQuerySet& query_set) &&
        requires std::same_as<Q, NoOcclusionQuery>
    {
        return RenderPassDescriptor<OcclusionQueryNotStarted>(std::move(target_), query_set.handle_ptr());
    }

    [[nodiscard]] const RenderTarget& target() const { return target_; }
    [[nodiscard]] const std::shared_ptr<driver::QuerySet>& occlusion_query_set_handle() const {
        return occlusion_query_set_;
    }

private:
    template<OcclusionQueryState>
    friend class RenderPassDescriptor;

    RenderPassDescriptor(RenderTarget target, std::shared_ptr<driver::QuerySet> occlusion_query_set)
        : target_(std::move(target)), occlusion_query_set_(std::move(occlusion_query_set)) {}

    RenderTarget target_;
    std::shared_ptr<driver::QuerySet> occlusion_query_set_;
};

}  // namespace gpubind::graphics
