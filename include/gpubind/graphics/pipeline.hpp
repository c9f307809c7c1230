// GpuBind Graphics Layer
// pipeline.hpp - Shader modules, pipeline layouts and pipelines

#pragma once

#include "bind_group.hpp"

#include <gpubind/driver/driver.hpp>

#include <concepts>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gpubind::graphics {

class ShaderModule {
public:
    explicit ShaderModule(std::shared_ptr<driver::ShaderModule> handle) : handle_(std::move(handle)) {}

    [[nodiscard]] const driver::ShaderModule& handle() const { return *handle_; }

private:
    std::shared_ptr<driver::ShaderModule> handle_;
};

class PipelineLayout {
public:
    PipelineLayout(std::shared_ptr<driver::PipelineLayout> handle, std::vector<BindGroupLayout> bind_group_layouts)
        : handle_(std::move(handle)), bind_group_layouts_(std::move(bind_group_layouts)) {}

    [[nodiscard]] const driver::PipelineLayout& handle() const { return *handle_; }
    [[nodiscard]] const std::vector<BindGroupLayout>& bind_group_layouts() const { return bind_group_layouts_; }

private:
    std::shared_ptr<driver::PipelineLayout> handle_;
    std::vector<BindGroupLayout> bind_group_layouts_;
};

// Attachment formats a render pass, pipeline or bundle renders to
struct RenderTargetLayout {
    std::vector<TextureFormat> color_formats;
    std::optional<TextureFormat> depth_stencil_format;
    uint32_t sample_count = 1;

    bool operator==(const RenderTargetLayout&) const = default;
};

// Specialize for every vertex type:
//
//   template<> struct VertexLayoutOf<MyVertex> {
//       static driver::VertexBufferLayout layout() { ... }
//   };
template<typename V>
struct VertexLayoutOf;

template<typename V>
concept Vertex = requires {
    { VertexLayoutOf<V>::layout() } -> std::same_as<driver::VertexBufferLayout>;
};

template<Vertex... Vs>
[[nodiscard]] std::vector<driver::VertexBufferLayout> vertex_layouts() {
    return {VertexLayoutOf<Vs>::layout()...};
}

// ============================================================================
// Descriptors
// ============================================================================

struct ComputePipelineDescriptor {
    const PipelineLayout* layout = nullptr;
    const ShaderModule* shader_module = nullptr;
    std::string entry_point = "main";
    std::map<std::string, double> constants;
};

struct RenderPipelineDescriptor {
    const PipelineLayout* layout = nullptr;
    const ShaderModule* vertex_module = nullptr;
    std::string vertex_entry_point = "vs_main";
    std::vector<driver::VertexBufferLayout> vertex_buffer_layouts;
    driver::PrimitiveTopology topology = driver::PrimitiveTopology::TriangleList;
    std::optional<driver::IndexFormat> strip_index_format;
    driver::CullMode cull_mode = driver::CullMode::None;
    const ShaderModule* fragment_module = nullptr;
    std::string fragment_entry_point = "fs_main";
    std::vector<driver::ColorTargetState> color_targets;
    std::optional<driver::DepthStencilState> depth_stencil;
    uint32_t sample_count = 1;
    std::map<std::string, double> constants;
};

// ============================================================================
// Pipelines
// ============================================================================

class ComputePipeline {
public:
    ComputePipeline(std::shared_ptr<driver::ComputePipeline> handle, std::vector<BindGroupLayout> bind_group_layouts);

    [[nodiscard]] uint64_t id() const { return id_; }
    [[nodiscard]] const driver::ComputePipeline& handle() const { return *handle_; }
    [[nodiscard]] const std::shared_ptr<driver::ComputePipeline>& handle_ptr() const { return handle_; }
    [[nodiscard]] const std::vector<BindGroupLayout>& bind_group_layouts() const { return bind_group_layouts_; }

private:
    std::shared_ptr<driver::ComputePipeline> handle_;
    std::vector<BindGroupLayout> bind_group_layouts_;
    uint64_t id_;
};

class RenderPipeline {
public:
    RenderPipeline(std::shared_ptr<driver::RenderPipeline> handle, std::vector<BindGroupLayout> bind_group_layouts,
                   const RenderPipelineDescriptor& desc);

    [[nodiscard]] uint64_t id() const { return id_; }
    [[nodiscard]] const driver::RenderPipeline& handle() const { return *handle_; }
    [[nodiscard]] const std::shared_ptr<driver::RenderPipeline>& handle_ptr() const { return handle_; }
    [[nodiscard]] const std::vector<BindGroupLayout>& bind_group_layouts() const { return bind_group_layouts_; }
    [[nodiscard]] const std::vector<driver::VertexBufferLayout>& vertex_layouts() const { return vertex_layouts_; }
    [[nodiscard]] driver::PrimitiveTopology topology() const { return topology_; }
    [[nodiscard]] std::optional<driver::IndexFormat> strip_index_format() const { return strip_index_format_; }
    [[nodiscard]] const RenderTargetLayout& target_layout() const { return target_layout_; }

private:
    std::shared_ptr<driver::RenderPipeline> handle_;
    std::vector<BindGroupLayout> bind_group_layouts_;
    std::vector<driver::VertexBufferLayout> vertex_layouts_;
    driver::PrimitiveTopology topology_;
    std::optional<driver::IndexFormat> strip_index_format_;
    RenderTargetLayout target_layout_;
    uint64_t id_;
};

namespace detail {

[[nodiscard]] bool is_strip_topology(driver::PrimitiveTopology topology);

// Fatal when a list topology names a strip index format
void validate_render_pipeline_descriptor(const RenderPipelineDescriptor& desc);

}  // namespace detail

}  // namespace gpubind::graphics
