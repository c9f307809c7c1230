// GpuBind Graphics Layer
// query_set.hpp - Occlusion and timestamp query sets

#pragma once

#include <gpubind/driver/driver.hpp>

#include <memory>

namespace gpubind::graphics {

inline constexpr uint32_t MAX_QUERY_SET_LEN = 8192;

namespace detail {

// Fatal unless len < MAX_QUERY_SET_LEN
void validate_query_set_len(uint32_t len);

}  // namespace detail

template<driver::QueryType Type>
class QuerySet {
public:
    static constexpr driver::QueryType type = Type;

    explicit QuerySet(std::shared_ptr<driver::QuerySet> handle) : handle_(std::move(handle)) {}

    [[nodiscard]] uint32_t len() const { return handle_->count(); }
    [[nodiscard]] const driver::QuerySet& handle() const { return *handle_; }
    [[nodiscard]] const std::shared_ptr<driver::QuerySet>& handle_ptr() const { return handle_; }

private:
    std::shared_ptr<driver::QuerySet> handle_;
};

using OcclusionQuerySet = QuerySet<driver::QueryType::Occlusion>;
using TimestampQuerySet = QuerySet<driver::QueryType::Timestamp>;

}  // namespace gpubind::graphics
