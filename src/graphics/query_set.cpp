// GpuBind Graphics Layer
// query_set.cpp - Query set limits

#include <gpubind/graphics/query_set.hpp>

#include <gpubind/core/assert.hpp>

namespace gpubind::graphics::detail {

void validate_query_set_len(uint32_t len) {
    GPUBIND_ASSERT(len < MAX_QUERY_SET_LEN, "query set len must be less than {}, got {}", MAX_QUERY_SET_LEN, len);
}

}  // namespace gpubind::graphics::detail
