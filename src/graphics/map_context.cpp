// GpuBind Graphics Layer
// map_context.cpp - Mapped range bookkeeping

#include <gpubind/graphics/map_context.hpp>

#include <gpubind/core/assert.hpp>

#include <algorithm>

namespace gpubind::graphics {

MapContext::MapContext(size_t buffer_size) : buffer_size_(buffer_size) {}

uint64_t MapContext::begin_map(ByteRange range, driver::MapMode mode) {
    GPUBIND_ASSERT(!initial_range_.has_value(), "Buffer is already mapped");
    GPUBIND_ASSERT(!range.empty(), "cannot map the empty range [{}, {})", range.start, range.end);
    GPUBIND_ASSERT(range.start < range.end && range.end <= buffer_size_,
                   "map range [{}, {}) exceeds buffer size {}", range.start, range.end, buffer_size_);
    initial_range_ = range;
    mode_ = mode;
    pending_ = true;
    return ++generation_;
}

void MapContext::begin_mapped(ByteRange range, driver::MapMode mode) {
    // A zero-sized buffer created mapped has nothing to map
    if (range.empty()) {
        return;
    }
    begin_map(range, mode);
    pending_ = false;
}

void MapContext::complete(uint64_t generation) {
    if (generation == generation_ && is_pending()) {
        pending_ = false;
    }
}

void MapContext::fail(uint64_t generation) {
    if (generation == generation_ && is_pending()) {
        initial_range_.reset();
        pending_ = false;
    }
}

void MapContext::reset() {
    GPUBIND_ASSERT(sub_ranges_.empty(), "cannot unmap a buffer that still has accessible mapped views");
    initial_range_.reset();
    pending_ = false;
}

void MapContext::add(ByteRange range) {
    GPUBIND_ASSERT(is_mapped(), "buffer is not mapped");
    GPUBIND_ASSERT(range.start <= range.end, "range start {} is past its end {}", range.start, range.end);
    GPUBIND_ASSERT(initial_range_->contains(range), "range [{}, {}) lies outside the mapped range [{}, {})",
                   range.start, range.end, initial_range_->start, initial_range_->end);

    for (const auto& live : sub_ranges_) {
        GPUBIND_ASSERT(!live.intersects(range), "range [{}, {}) overlaps mapped range [{}, {})", range.start,
                       range.end, live.start, live.end);
    }
    sub_ranges_.push_back(range);
}

void MapContext::remove(ByteRange range) {
    auto it = std::find(sub_ranges_.begin(), sub_ranges_.end(), range);
    GPUBIND_ASSERT(it != sub_ranges_.end(), "range [{}, {}) is not mapped", range.start, range.end);
    sub_ranges_.erase(it);
}

}  // namespace gpubind::graphics
