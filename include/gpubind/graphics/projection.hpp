// GpuBind Graphics Layer
// projection.hpp - Field offsets for projecting a view onto a struct member

#pragma once

#include <cstddef>
#include <type_traits>

namespace gpubind::graphics {

// The byte offset of a Field inside a Parent. Only GPUBIND_PROJECTION builds
// these from a real member, other offsets are the caller's responsibility.
template<typename Parent, typename Field>
class Projection {
public:
    using parent_type = Parent;
    using field_type = Field;

    [[nodiscard]] static constexpr Projection from_offset_unchecked(size_t offset) { return Projection(offset); }

    [[nodiscard]] constexpr size_t offset() const { return offset_; }

private:
    constexpr explicit Projection(size_t offset) : offset_(offset) {}

    size_t offset_;
};

namespace detail {

template<typename Parent>
constexpr size_t checked_field_offset(size_t offset) {
    static_assert(std::is_standard_layout_v<Parent>, "projected types must be standard-layout");
    return offset;
}

}  // namespace detail

}  // namespace gpubind::graphics

#define GPUBIND_PROJECTION(Parent, field)                                                 \
    ::gpubind::graphics::Projection<Parent, decltype(Parent::field)>::from_offset_unchecked( \
        ::gpubind::graphics::detail::checked_field_offset<Parent>(offsetof(Parent, field)))
