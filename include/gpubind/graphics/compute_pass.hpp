// GpuBind Graphics Layer
// compute_pass.hpp - Compute pass encoder

#pragma once

#include "command_encoder.hpp"
#include "pass_state.hpp"

#include <concepts>
#include <memory>

namespace gpubind::graphics {

namespace detail {

struct ComputePassParts {
    CommandEncoder encoder;
    std::unique_ptr<driver::ComputePassEncoder> pass;
    ComputeStateTracker state;
};

}  // namespace detail

// P tracks the pipeline, R the bind groups. Dispatching requires a pipeline.
template<typename P, typename R>
class ComputePassEncoder {
public:
    ComputePassEncoder(ComputePassEncoder&&) noexcept = default;
    ComputePassEncoder& operator=(ComputePassEncoder&&) noexcept = default;
    ComputePassEncoder(const ComputePassEncoder&) = delete;
    ComputePassEncoder& operator=(const ComputePassEncoder&) = delete;

    [[nodiscard]] ComputePassEncoder<PipelineSet, R> set_pipeline(const ComputePipeline& pipeline) && {
        if (parts_.state.set_pipeline(*parts_.pass, pipeline)) {
            parts_.encoder.retain(pipeline.handle_ptr());
        }
        return ComputePassEncoder<PipelineSet, R>(std::move(parts_));
    }

    [[nodiscard]] ComputePassEncoder<P, BindGroupsSet> set_bind_group(uint32_t index, const BindGroup& bind_group) && {
        bind(index, bind_group);
        return ComputePassEncoder<P, BindGroupsSet>(std::move(parts_));
    }

    // Binds the groups at consecutive indices starting from 0
    template<std::same_as<BindGroup>... Gs>
    [[nodiscard]] ComputePassEncoder<P, BindGroupsSet> set_bind_groups(const Gs&... bind_groups) && {
        uint32_t index = 0;
        (bind(index++, bind_groups), ...);
        return ComputePassEncoder<P, BindGroupsSet>(std::move(parts_));
    }

    [[nodiscard]] ComputePassEncoder dispatch_workgroups(uint32_t x, uint32_t y = 1, uint32_t z = 1) &&
        requires std::same_as<P, PipelineSet>
    {
        parts_.state.dispatch(*parts_.pass, x, y, z);
        return std::move(*this);
    }

    template<BufferUsage U>
    [[nodiscard]] ComputePassEncoder dispatch_workgroups_indirect(
        const View<driver::DispatchWorkgroups, U>& arguments) &&
        requires(std::same_as<P, PipelineSet> && has_flag(U, BufferUsage::Indirect))
    {
        parts_.state.dispatch_indirect(*parts_.pass, arguments.resource()->handle(), arguments.offset());
        parts_.encoder.retain(arguments.resource());
        return std::move(*this);
    }

    [[nodiscard]] CommandEncoder end() && {
        parts_.pass->end();
        parts_.pass.reset();
        return std::move(parts_.encoder);
    }

private:
    template<typename, typename>
    friend class ComputePassEncoder;
    friend class CommandEncoder;

    explicit ComputePassEncoder(detail::ComputePassParts parts) : parts_(std::move(parts)) {}

    void bind(uint32_t index, const BindGroup& bind_group) {
        if (parts_.state.set_bind_group(*parts_.pass, index, bind_group)) {
            parts_.encoder.retain(bind_group.keep_alive());
        }
    }

    detail::ComputePassParts parts_;
};

}  // namespace gpubind::graphics
