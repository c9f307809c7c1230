// GpuBind Graphics Layer
// cast.cpp - Cast precondition checks

#include <gpubind/graphics/cast.hpp>

#include <spdlog/fmt/fmt.h>

namespace gpubind::graphics {

std::string CastError::what() const {
    switch (kind) {
        case CastErrorKind::SizeMismatch:
            return fmt::format("cannot cast {} bytes to a {} byte value", source_size, target_size);
        case CastErrorKind::NotAMultiple:
            return fmt::format("{} bytes is not a multiple of the {} byte element size", source_size, target_size);
        case CastErrorKind::Misaligned:
            return fmt::format("byte offset is not aligned for a {} byte element", target_size);
    }
    return "invalid cast";
}

namespace detail {

core::Result<void, CastError> check_value_cast(size_t offset, size_t source_size, size_t target_size,
                                               size_t target_alignment) {
    if (source_size != target_size) {
        return core::unexpected(CastError{CastErrorKind::SizeMismatch, source_size, target_size});
    }
    if (offset % target_alignment != 0) {
        return core::unexpected(CastError{CastErrorKind::Misaligned, source_size, target_size});
    }
    return {};
}

core::Result<void, CastError> check_slice_cast(size_t offset, size_t source_size, size_t target_size,
                                               size_t target_alignment) {
    if (source_size % target_size != 0) {
        return core::unexpected(CastError{CastErrorKind::NotAMultiple, source_size, target_size});
    }
    if (offset % target_alignment != 0) {
        return core::unexpected(CastError{CastErrorKind::Misaligned, source_size, target_size});
    }
    return {};
}

}  // namespace detail

}  // namespace gpubind::graphics
