// GpuBind Graphics Layer
// graphics.hpp - Main include for the typed graphics API

#pragma once

#include "bind_group.hpp"
#include "binding.hpp"
#include "buffer.hpp"
#include "cast.hpp"
#include "command_encoder.hpp"
#include "compute_pass.hpp"
#include "device.hpp"
#include "encoder_state.hpp"
#include "image_copy.hpp"
#include "map_future.hpp"
#include "mapped.hpp"
#include "pipeline.hpp"
#include "projection.hpp"
#include "query_set.hpp"
#include "queue.hpp"
#include "range.hpp"
#include "render_bundle.hpp"
#include "render_pass.hpp"
#include "render_target.hpp"
#include "sampler.hpp"
#include "texture.hpp"
#include "vertex_buffer.hpp"
#include "view.hpp"
