// GpuBind Graphics Layer
// encoder_state.hpp - Type-state markers of the pass encoders
//
// Pass encoders carry one marker per state axis as a template argument. Every
// state-changing call consumes the encoder and returns it with the updated
// markers, so calls that need state the encoder does not have yet don't exist
// on its type.

#pragma once

#include <concepts>

namespace gpubind::graphics {

// Pipeline
struct NoPipeline {};
struct PipelineSet {};

// Vertex buffers
struct NoVertexBuffers {};
struct VertexBuffersSet {};

// Index buffer
struct NoIndexBuffer {};
struct IndexBufferSet {};

// Bind groups
struct NoBindGroups {};
struct BindGroupsSet {};

// Occlusion query phase of a render pass
struct NoOcclusionQuery {};
struct OcclusionQueryNotStarted {};
struct OcclusionQueryStarted {};
struct OcclusionQueryEnded {};

template<typename Q>
concept OcclusionQueryState = std::same_as<Q, NoOcclusionQuery> || std::same_as<Q, OcclusionQueryNotStarted> ||
                              std::same_as<Q, OcclusionQueryStarted> || std::same_as<Q, OcclusionQueryEnded>;

// A new query may start before the first one or after the previous one ended
template<typename Q>
concept CanBeginOcclusionQuery = std::same_as<Q, OcclusionQueryNotStarted> || std::same_as<Q, OcclusionQueryEnded>;

}  // namespace gpubind::graphics
