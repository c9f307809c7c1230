// GpuBind Graphics Layer
// range.hpp - Index ranges accepted by slice views

#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>

namespace gpubind::graphics {

// [start, end)
struct Range {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const Range&) const = default;
};

// [start, end]
struct RangeInclusive {
    size_t start = 0;
    size_t end = 0;
};

// [start, len)
struct RangeFrom {
    size_t start = 0;
};

// [0, end)
struct RangeTo {
    size_t end = 0;
};

// [0, end]
struct RangeToInclusive {
    size_t end = 0;
};

// [0, len)
struct RangeFull {};

// Converts to exclusive bounds. Inclusive ranges ending at the largest index
// have no exclusive form and yield nullopt. Bounds are not checked against len.
[[nodiscard]] constexpr std::optional<Range> to_exclusive(const Range& range, size_t /*len*/) {
    return range;
}

[[nodiscard]] constexpr std::optional<Range> to_exclusive(const RangeInclusive& range, size_t /*len*/) {
    if (range.end == std::numeric_limits<size_t>::max()) {
        return std::nullopt;
    }
    return Range{range.start, range.end + 1};
}

[[nodiscard]] constexpr std::optional<Range> to_exclusive(const RangeFrom& range, size_t len) {
    return Range{range.start, len};
}

[[nodiscard]] constexpr std::optional<Range> to_exclusive(const RangeTo& range, size_t /*len*/) {
    return Range{0, range.end};
}

[[nodiscard]] constexpr std::optional<Range> to_exclusive(const RangeToInclusive& range, size_t len) {
    return to_exclusive(RangeInclusive{0, range.end}, len);
}

[[nodiscard]] constexpr std::optional<Range> to_exclusive(const RangeFull& /*range*/, size_t len) {
    return Range{0, len};
}

// The closed set of range types above
template<typename R>
concept SliceRange = requires(const R& range, size_t len) {
    { to_exclusive(range, len) } -> std::same_as<std::optional<Range>>;
};

// Checked form: nullopt unless start <= end <= len
template<SliceRange R>
[[nodiscard]] constexpr std::optional<Range> checked_bounds(const R& range, size_t len) {
    auto bounds = to_exclusive(range, len);
    if (!bounds.has_value() || bounds->start > bounds->end || bounds->end > len) {
        return std::nullopt;
    }
    return bounds;
}

}  // namespace gpubind::graphics
