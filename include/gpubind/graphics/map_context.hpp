// GpuBind Graphics Layer
// map_context.hpp - Bookkeeping of the mapped range of a buffer and its live guards

#pragma once

#include <gpubind/driver/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace gpubind::graphics {

// Half-open byte range [start, end)
struct ByteRange {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] size_t size() const { return end - start; }
    [[nodiscard]] bool empty() const { return start == end; }

    [[nodiscard]] bool contains(const ByteRange& other) const {
        return other.start >= start && other.end <= end;
    }

    [[nodiscard]] bool intersects(const ByteRange& other) const {
        return other.start < end && start < other.end;
    }

    bool operator==(const ByteRange&) const = default;
};

// Tracks the range granted by the current map request and the sub-ranges
// handed out to Mapped/MappedMut guards. Not thread-safe on its own, the
// owning buffer serializes access.
class MapContext {
public:
    explicit MapContext(size_t buffer_size);

    // Starts a map request. Fatal if the range is empty, the buffer is already mapped or a
    // request is in flight.
    // Returns the generation the completion must present.
    uint64_t begin_map(ByteRange range, driver::MapMode mode);

    // Buffers created mapped skip the request. An empty range leaves the context unmapped.
    void begin_mapped(ByteRange range, driver::MapMode mode);

    // Resolves the request of the given generation, stale generations are ignored
    void complete(uint64_t generation);
    void fail(uint64_t generation);

    // Fatal while guards are still alive
    void reset();

    // Fatal unless the range is inside the mapped range and disjoint from every live guard
    void add(ByteRange range);
    void remove(ByteRange range);

    [[nodiscard]] bool is_mapped() const { return initial_range_.has_value() && !pending_; }
    [[nodiscard]] bool is_pending() const { return initial_range_.has_value() && pending_; }
    [[nodiscard]] const std::optional<ByteRange>& initial_range() const { return initial_range_; }
    [[nodiscard]] const std::vector<ByteRange>& sub_ranges() const { return sub_ranges_; }
    [[nodiscard]] driver::MapMode mode() const { return mode_; }

private:
    size_t buffer_size_;
    std::optional<ByteRange> initial_range_;
    std::vector<ByteRange> sub_ranges_;
    driver::MapMode mode_ = driver::MapMode::Read;
    bool pending_ = false;
    uint64_t generation_ = 0;
};

}  // namespace gpubind::graphics
