// GpuBind Graphics Layer
// cast.hpp - Reinterpreting views and buffers as other plain-data types
//
// View casts take the view by reference and leave it untouched. Buffer casts
// take the buffer by rvalue reference but only move from it on success, so a
// failed cast hands the buffer back to the caller unchanged.

#pragma once

#include "buffer.hpp"

#include <gpubind/core/result.hpp>

#include <string>

namespace gpubind::graphics {

enum class CastErrorKind : uint8_t {
    SizeMismatch,  // byte length differs from the target size
    NotAMultiple,  // byte length is not a whole number of target elements
    Misaligned,    // byte offset breaks the target alignment
};

struct CastError {
    CastErrorKind kind = CastErrorKind::SizeMismatch;
    size_t source_size = 0;
    size_t target_size = 0;

    [[nodiscard]] std::string what() const;
};

namespace detail {

[[nodiscard]] core::Result<void, CastError> check_value_cast(size_t offset, size_t source_size, size_t target_size,
                                                            size_t target_alignment);
[[nodiscard]] core::Result<void, CastError> check_slice_cast(size_t offset, size_t source_size, size_t target_size,
                                                            size_t target_alignment);

}  // namespace detail

// ============================================================================
// Views
// ============================================================================

template<BufferData T, BufferUsage U>
[[nodiscard]] View<std::byte[], U> bytes_of(const View<T, U>& view) {
    return View<std::byte[], U>(view.resource(), view.offset(), sizeof(T));
}

template<typename T, BufferUsage U>
[[nodiscard]] View<std::byte[], U> bytes_of_slice(const View<T[], U>& view) {
    return View<std::byte[], U>(view.resource(), view.offset(), view.size_in_bytes());
}

template<BufferData T, BufferUsage U>
[[nodiscard]] core::Result<View<T, U>, CastError> try_from_bytes(const View<std::byte[], U>& bytes) {
    if (auto check = detail::check_value_cast(bytes.offset(), bytes.len(), sizeof(T), alignof(T)); check.is_err()) {
        return core::unexpected(check.error());
    }
    return View<T, U>(bytes.resource(), bytes.offset());
}

template<BufferData T, BufferUsage U>
[[nodiscard]] View<T, U> from_bytes(const View<std::byte[], U>& bytes) {
    auto result = try_from_bytes<T>(bytes);
    GPUBIND_ASSERT(result.is_ok(), "{}", result.error().what());
    return std::move(result).value();
}

template<BufferData T, BufferUsage U>
[[nodiscard]] core::Result<View<T[], U>, CastError> try_slice_from_bytes(const View<std::byte[], U>& bytes) {
    if (auto check = detail::check_slice_cast(bytes.offset(), bytes.len(), sizeof(T), alignof(T)); check.is_err()) {
        return core::unexpected(check.error());
    }
    return View<T[], U>(bytes.resource(), bytes.offset(), bytes.len() / sizeof(T));
}

template<BufferData T, BufferUsage U>
[[nodiscard]] View<T[], U> slice_from_bytes(const View<std::byte[], U>& bytes) {
    auto result = try_slice_from_bytes<T>(bytes);
    GPUBIND_ASSERT(result.is_ok(), "{}", result.error().what());
    return std::move(result).value();
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] core::Result<View<B, U>, CastError> try_cast(const View<A, U>& view) {
    return try_from_bytes<B>(bytes_of(view));
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] View<B, U> cast(const View<A, U>& view) {
    return from_bytes<B>(bytes_of(view));
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] core::Result<View<B[], U>, CastError> try_cast_slice(const View<A[], U>& view) {
    return try_slice_from_bytes<B>(bytes_of_slice(view));
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] View<B[], U> cast_slice(const View<A[], U>& view) {
    return slice_from_bytes<B>(bytes_of_slice(view));
}

// ============================================================================
// Buffers
// ============================================================================

template<BufferData T, BufferUsage U>
[[nodiscard]] Buffer<std::byte[], U> bytes_of(Buffer<T, U>&& buffer) {
    return Buffer<std::byte[], U>(std::move(buffer).into_resource());
}

template<typename T, BufferUsage U>
[[nodiscard]] Buffer<std::byte[], U> bytes_of_slice(Buffer<T[], U>&& buffer) {
    return Buffer<std::byte[], U>(std::move(buffer).into_resource());
}

template<BufferData T, BufferUsage U>
[[nodiscard]] core::Result<Buffer<T, U>, CastError> try_from_bytes(Buffer<std::byte[], U>&& bytes) {
    if (auto check = detail::check_value_cast(0, bytes.len(), sizeof(T), alignof(T)); check.is_err()) {
        return core::unexpected(check.error());
    }
    return Buffer<T, U>(std::move(bytes).into_resource());
}

template<BufferData T, BufferUsage U>
[[nodiscard]] Buffer<T, U> from_bytes(Buffer<std::byte[], U>&& bytes) {
    auto result = try_from_bytes<T>(std::move(bytes));
    GPUBIND_ASSERT(result.is_ok(), "{}", result.error().what());
    return std::move(result).value();
}

template<BufferData T, BufferUsage U>
[[nodiscard]] core::Result<Buffer<T[], U>, CastError> try_slice_from_bytes(Buffer<std::byte[], U>&& bytes) {
    if (auto check = detail::check_slice_cast(0, bytes.len(), sizeof(T), alignof(T)); check.is_err()) {
        return core::unexpected(check.error());
    }
    return Buffer<T[], U>(std::move(bytes).into_resource());
}

template<BufferData T, BufferUsage U>
[[nodiscard]] Buffer<T[], U> slice_from_bytes(Buffer<std::byte[], U>&& bytes) {
    auto result = try_slice_from_bytes<T>(std::move(bytes));
    GPUBIND_ASSERT(result.is_ok(), "{}", result.error().what());
    return std::move(result).value();
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] core::Result<Buffer<B, U>, CastError> try_cast(Buffer<A, U>&& buffer) {
    if (auto check = detail::check_value_cast(0, sizeof(A), sizeof(B), alignof(B)); check.is_err()) {
        return core::unexpected(check.error());
    }
    return Buffer<B, U>(std::move(buffer).into_resource());
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] Buffer<B, U> cast(Buffer<A, U>&& buffer) {
    auto result = try_cast<B>(std::move(buffer));
    GPUBIND_ASSERT(result.is_ok(), "{}", result.error().what());
    return std::move(result).value();
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] core::Result<Buffer<B[], U>, CastError> try_cast_slice(Buffer<A[], U>&& buffer) {
    if (auto check = detail::check_slice_cast(0, buffer.size_in_bytes(), sizeof(B), alignof(B)); check.is_err()) {
        return core::unexpected(check.error());
    }
    return Buffer<B[], U>(std::move(buffer).into_resource());
}

template<BufferData B, BufferData A, BufferUsage U>
[[nodiscard]] Buffer<B[], U> cast_slice(Buffer<A[], U>&& buffer) {
    auto result = try_cast_slice<B>(std::move(buffer));
    GPUBIND_ASSERT(result.is_ok(), "{}", result.error().what());
    return std::move(result).value();
}

}  // namespace gpubind::graphics
