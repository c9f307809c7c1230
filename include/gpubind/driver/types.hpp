// GpuBind Driver Contract
// types.hpp - Plain-data descriptors exchanged with a driver

#pragma once

#include <gpubind/format/texture_format.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <glm/vec4.hpp>

namespace gpubind::driver {

using format::TextureFormat;

class Buffer;
class Texture;
class TextureView;
class Sampler;
class BindGroupLayout;
class PipelineLayout;
class QuerySet;
class ShaderModule;

// ============================================================================
// Usage Flags
// ============================================================================

enum class BufferUsage : uint32_t {
    None = 0x0000,
    MapRead = 0x0001,
    MapWrite = 0x0002,
    CopySrc = 0x0004,
    CopyDst = 0x0008,
    Index = 0x0010,
    Vertex = 0x0020,
    Uniform = 0x0040,
    Storage = 0x0080,
    Indirect = 0x0100,
    QueryResolve = 0x0200,
};

constexpr BufferUsage operator|(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr BufferUsage operator&(BufferUsage a, BufferUsage b) {
    return static_cast<BufferUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool has_flag(BufferUsage flags, BufferUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

// Mappable buffers may only be combined with the matching copy direction
constexpr bool is_valid_buffer_usage(BufferUsage usage) {
    constexpr BufferUsage map_flags = BufferUsage::MapRead | BufferUsage::MapWrite;
    if (!has_flag(usage, map_flags)) {
        return true;
    }
    return usage == (BufferUsage::MapRead | BufferUsage::CopyDst) ||
           usage == (BufferUsage::MapWrite | BufferUsage::CopySrc);
}

enum class TextureUsage : uint32_t {
    None = 0x0000,
    RenderAttachment = 0x0001,
    StorageBinding = 0x0002,
    TextureBinding = 0x0004,
    CopyDst = 0x0008,
    CopySrc = 0x0010,
};

constexpr TextureUsage operator|(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr TextureUsage operator&(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr bool has_flag(TextureUsage flags, TextureUsage flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

enum class ShaderStage : uint32_t {
    None = 0x0000,
    Vertex = 0x0001,
    Fragment = 0x0002,
    Compute = 0x0004,
};

constexpr ShaderStage operator|(ShaderStage a, ShaderStage b) {
    return static_cast<ShaderStage>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

// ============================================================================
// Buffers
// ============================================================================

enum class MapMode : uint8_t {
    Read,
    Write,
};

enum class MapStatus : uint8_t {
    Success,
    DeviceLost,
    Destroyed,
    Aborted,
    Unknown,
};

struct BufferDescriptor {
    size_t size = 0;
    BufferUsage usage = BufferUsage::None;
    bool mapped_at_creation = false;
    std::string label;
};

struct BufferBinding {
    const Buffer* buffer = nullptr;
    size_t offset = 0;
    size_t size = 0;
};

// ============================================================================
// Textures
// ============================================================================

struct Extent3D {
    uint32_t width = 1;
    uint32_t height = 1;
    uint32_t depth_or_layers = 1;

    bool operator==(const Extent3D&) const = default;
};

struct Origin3D {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t z = 0;

    bool operator==(const Origin3D&) const = default;
};

enum class TextureDimension : uint8_t {
    D1,
    D2,
    D3,
};

enum class TextureViewDimension : uint8_t {
    D1,
    D2,
    D2Array,
    Cube,
    CubeArray,
    D3,
};

enum class TextureAspect : uint8_t {
    All,
    StencilOnly,
    DepthOnly,
};

struct TextureDescriptor {
    Extent3D size;
    uint32_t mip_level_count = 1;
    uint32_t sample_count = 1;
    TextureDimension dimension = TextureDimension::D2;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    TextureUsage usage = TextureUsage::None;
    std::vector<TextureFormat> view_formats;
    std::string label;
};

struct TextureViewDescriptor {
    TextureFormat format = TextureFormat::RGBA8Unorm;
    TextureViewDimension dimension = TextureViewDimension::D2;
    TextureAspect aspect = TextureAspect::All;
    uint32_t base_mip_level = 0;
    uint32_t mip_level_count = 1;
    uint32_t base_array_layer = 0;
    uint32_t array_layer_count = 1;
};

// ============================================================================
// Samplers
// ============================================================================

enum class AddressMode : uint8_t {
    ClampToEdge,
    Repeat,
    MirrorRepeat,
};

enum class FilterMode : uint8_t {
    Nearest,
    Linear,
};

enum class CompareFunction : uint8_t {
    Never,
    Less,
    Equal,
    LessEqual,
    Greater,
    NotEqual,
    GreaterEqual,
    Always,
};

struct SamplerDescriptor {
    AddressMode address_mode_u = AddressMode::ClampToEdge;
    AddressMode address_mode_v = AddressMode::ClampToEdge;
    AddressMode address_mode_w = AddressMode::ClampToEdge;
    FilterMode magnification_filter = FilterMode::Nearest;
    FilterMode minification_filter = FilterMode::Nearest;
    FilterMode mipmap_filter = FilterMode::Nearest;
    float lod_min_clamp = 0.0f;
    float lod_max_clamp = 32.0f;
    uint16_t max_anisotropy = 1;
    std::optional<CompareFunction> compare;
};

// ============================================================================
// Queries
// ============================================================================

enum class QueryType : uint8_t {
    Occlusion,
    Timestamp,
};

struct QuerySetDescriptor {
    QueryType type = QueryType::Occlusion;
    uint32_t count = 0;
};

// ============================================================================
// Resource Binding
// ============================================================================

enum class BufferBindingType : uint8_t {
    Uniform,
    Storage,
    ReadOnlyStorage,
};

enum class SamplerBindingType : uint8_t {
    Filtering,
    NonFiltering,
    Comparison,
};

enum class StorageTextureAccess : uint8_t {
    ReadOnly,
    WriteOnly,
    ReadWrite,
};

struct BufferBindingLayout {
    BufferBindingType type = BufferBindingType::Uniform;

    bool operator==(const BufferBindingLayout&) const = default;
};

struct SamplerBindingLayout {
    SamplerBindingType type = SamplerBindingType::Filtering;

    bool operator==(const SamplerBindingLayout&) const = default;
};

struct TextureBindingLayout {
    format::SampleType sample_type = format::SampleType::Float;
    TextureViewDimension dimension = TextureViewDimension::D2;
    bool multisampled = false;

    bool operator==(const TextureBindingLayout&) const = default;
};

struct StorageTextureBindingLayout {
    StorageTextureAccess access = StorageTextureAccess::WriteOnly;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    TextureViewDimension dimension = TextureViewDimension::D2;

    bool operator==(const StorageTextureBindingLayout&) const = default;
};

using BindingType =
    std::variant<BufferBindingLayout, SamplerBindingLayout, TextureBindingLayout, StorageTextureBindingLayout>;

struct BindGroupLayoutEntry {
    uint32_t binding = 0;
    ShaderStage visibility = ShaderStage::None;
    BindingType type;

    bool operator==(const BindGroupLayoutEntry&) const = default;
};

struct BindGroupLayoutDescriptor {
    std::vector<BindGroupLayoutEntry> entries;
};

struct PipelineLayoutDescriptor {
    std::vector<const BindGroupLayout*> bind_group_layouts;
};

using BindingResource = std::variant<BufferBinding, const TextureView*, const Sampler*>;

struct BindGroupEntry {
    uint32_t binding = 0;
    BindingResource resource;
};

struct BindGroupDescriptor {
    const BindGroupLayout* layout = nullptr;
    std::vector<BindGroupEntry> entries;
};

// ============================================================================
// Pipelines
// ============================================================================

enum class VertexFormat : uint8_t {
    Uint8x2,
    Uint8x4,
    Sint8x2,
    Sint8x4,
    Unorm8x2,
    Unorm8x4,
    Snorm8x2,
    Snorm8x4,
    Uint16x2,
    Uint16x4,
    Sint16x2,
    Sint16x4,
    Unorm16x2,
    Unorm16x4,
    Snorm16x2,
    Snorm16x4,
    Float16x2,
    Float16x4,
    Float32,
    Float32x2,
    Float32x3,
    Float32x4,
    Uint32,
    Uint32x2,
    Uint32x3,
    Uint32x4,
    Sint32,
    Sint32x2,
    Sint32x3,
    Sint32x4,
};

enum class VertexStepMode : uint8_t {
    Vertex,
    Instance,
};

struct VertexAttribute {
    VertexFormat format = VertexFormat::Float32;
    size_t offset = 0;
    uint32_t shader_location = 0;

    bool operator==(const VertexAttribute&) const = default;
};

struct VertexBufferLayout {
    size_t array_stride = 0;
    VertexStepMode step_mode = VertexStepMode::Vertex;
    std::vector<VertexAttribute> attributes;

    bool operator==(const VertexBufferLayout&) const = default;
};

enum class IndexFormat : uint8_t {
    Uint16,
    Uint32,
};

enum class PrimitiveTopology : uint8_t {
    PointList,
    LineList,
    LineStrip,
    TriangleList,
    TriangleStrip,
};

enum class CullMode : uint8_t {
    None,
    Front,
    Back,
};

struct ShaderModuleDescriptor {
    std::string code;
    std::string label;
};

struct ComputePipelineDescriptor {
    const PipelineLayout* layout = nullptr;
    const ShaderModule* shader_module = nullptr;
    std::string entry_point;
    std::map<std::string, double> constants;
};

struct ColorTargetState {
    TextureFormat format = TextureFormat::RGBA8Unorm;
    uint32_t write_mask = 0xF;
};

struct DepthStencilState {
    TextureFormat format = TextureFormat::Depth24Plus;
    bool depth_write_enabled = true;
    CompareFunction depth_compare = CompareFunction::Less;
};

struct RenderPipelineDescriptor {
    const PipelineLayout* layout = nullptr;
    const ShaderModule* vertex_module = nullptr;
    std::string vertex_entry_point;
    std::vector<VertexBufferLayout> vertex_buffer_layouts;
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    std::optional<IndexFormat> strip_index_format;
    CullMode cull_mode = CullMode::None;
    const ShaderModule* fragment_module = nullptr;
    std::string fragment_entry_point;
    std::vector<ColorTargetState> color_targets;
    std::optional<DepthStencilState> depth_stencil;
    uint32_t sample_count = 1;
    std::map<std::string, double> constants;
};

// ============================================================================
// Copies and Transfers
// ============================================================================

struct CopyBufferToBuffer {
    const Buffer* source = nullptr;
    size_t source_offset = 0;
    const Buffer* destination = nullptr;
    size_t destination_offset = 0;
    size_t size = 0;
};

struct ImageCopyBuffer {
    const Buffer* buffer = nullptr;
    size_t offset = 0;
    size_t size = 0;
    uint32_t bytes_per_block = 0;
    uint32_t blocks_per_row = 0;
    uint32_t rows_per_image = 0;
};

struct ImageCopyTexture {
    const Texture* texture = nullptr;
    uint32_t mip_level = 0;
    Origin3D origin;
    TextureAspect aspect = TextureAspect::All;
};

struct CopyBufferToTexture {
    ImageCopyBuffer source;
    ImageCopyTexture destination;
    Extent3D copy_size;
};

struct CopyTextureToBuffer {
    ImageCopyTexture source;
    ImageCopyBuffer destination;
    Extent3D copy_size;
};

struct CopyTextureToTexture {
    ImageCopyTexture source;
    ImageCopyTexture destination;
    Extent3D copy_size;
};

struct ClearBuffer {
    const Buffer* buffer = nullptr;
    size_t offset = 0;
    size_t size = 0;
};

struct ResolveQuerySet {
    const QuerySet* query_set = nullptr;
    uint32_t first_query = 0;
    uint32_t query_count = 0;
    const Buffer* destination = nullptr;
    size_t destination_offset = 0;
};

struct ImageDataLayout {
    size_t offset = 0;
    uint32_t bytes_per_row = 0;
    uint32_t rows_per_image = 0;
};

struct WriteBufferOperation {
    const Buffer* buffer = nullptr;
    size_t offset = 0;
    std::span<const std::byte> data;
};

struct WriteTextureOperation {
    ImageCopyTexture destination;
    ImageDataLayout layout;
    Extent3D size;
    std::span<const std::byte> data;
};

// ============================================================================
// Passes
// ============================================================================

enum class LoadOp : uint8_t {
    Load,
    Clear,
};

enum class StoreOp : uint8_t {
    Store,
    Discard,
};

struct RenderPassColorAttachment {
    const TextureView* view = nullptr;
    const TextureView* resolve_target = nullptr;
    LoadOp load_op = LoadOp::Clear;
    StoreOp store_op = StoreOp::Store;
    glm::dvec4 clear_value{0.0};
};

template<typename T>
struct DepthStencilOperations {
    LoadOp load_op = LoadOp::Clear;
    StoreOp store_op = StoreOp::Store;
    T clear_value{};
};

struct RenderPassDepthStencilAttachment {
    const TextureView* view = nullptr;
    std::optional<DepthStencilOperations<float>> depth_operations;
    std::optional<DepthStencilOperations<uint32_t>> stencil_operations;
};

struct RenderPassDescriptor {
    std::vector<RenderPassColorAttachment> color_attachments;
    std::optional<RenderPassDepthStencilAttachment> depth_stencil_attachment;
    const QuerySet* occlusion_query_set = nullptr;
};

struct RenderBundleEncoderDescriptor {
    std::vector<TextureFormat> color_formats;
    std::optional<TextureFormat> depth_stencil_format;
    uint32_t sample_count = 1;
    bool depth_read_only = false;
    bool stencil_read_only = false;
};

struct SetVertexBuffer {
    uint32_t slot = 0;
    const Buffer* buffer = nullptr;
    size_t offset = 0;
    size_t size = 0;
};

struct SetIndexBuffer {
    const Buffer* buffer = nullptr;
    IndexFormat format = IndexFormat::Uint32;
    size_t offset = 0;
    size_t size = 0;
};

struct Viewport {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float min_depth = 0.0f;
    float max_depth = 1.0f;

    bool operator==(const Viewport&) const = default;
};

struct ScissorRect {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const ScissorRect&) const = default;
};

using BlendConstant = glm::dvec4;

// Draw and dispatch arguments share the memory layout of indirect argument buffers
struct Draw {
    uint32_t vertex_count = 0;
    uint32_t instance_count = 1;
    uint32_t first_vertex = 0;
    uint32_t first_instance = 0;

    bool operator==(const Draw&) const = default;
};

struct DrawIndexed {
    uint32_t index_count = 0;
    uint32_t instance_count = 1;
    uint32_t first_index = 0;
    int32_t base_vertex = 0;
    uint32_t first_instance = 0;

    bool operator==(const DrawIndexed&) const = default;
};

struct DispatchWorkgroups {
    uint32_t count_x = 1;
    uint32_t count_y = 1;
    uint32_t count_z = 1;

    bool operator==(const DispatchWorkgroups&) const = default;
};

// ============================================================================
// Devices
// ============================================================================

struct DeviceDescriptor {
    std::string backend = "host";
    std::string mapping_mode = "direct";
    std::string label = "gpubind";
};

}  // namespace gpubind::driver
