// GpuBind Graphics Layer
// map_future.cpp - Asynchronous map completion

#include <gpubind/graphics/map_future.hpp>

#include <gpubind/core/logger.hpp>
#include <gpubind/driver/driver.hpp>

namespace gpubind::graphics {

const char* to_string(MapError error) {
    switch (error) {
        case MapError::DeviceLost:
            return "device lost";
        case MapError::Destroyed:
            return "buffer destroyed";
        case MapError::Aborted:
            return "map aborted";
        case MapError::Unknown:
            return "unknown map error";
    }
    return "unknown map error";
}

MapResult map_result_from_status(driver::MapStatus status) {
    switch (status) {
        case driver::MapStatus::Success:
            return {};
        case driver::MapStatus::DeviceLost:
            return core::unexpected(MapError::DeviceLost);
        case driver::MapStatus::Destroyed:
            return core::unexpected(MapError::Destroyed);
        case driver::MapStatus::Aborted:
            return core::unexpected(MapError::Aborted);
        case driver::MapStatus::Unknown:
            break;
    }
    return core::unexpected(MapError::Unknown);
}

namespace detail {

void MapRequestState::resolve(MapResult result_value) {
    std::function<void(MapResult)> pending_callback;
    {
        std::lock_guard lock(mutex);
        result = result_value;
        pending_callback = std::move(callback);
        callback = nullptr;
    }
    if (pending_callback) {
        pending_callback(result_value);
    }
}

}  // namespace detail

MapFuture::MapFuture(std::shared_ptr<driver::Device> device, std::shared_ptr<detail::MapRequestState> state)
    : device_(std::move(device)), state_(std::move(state)) {}

bool MapFuture::is_ready() const {
    std::lock_guard lock(state_->mutex);
    return state_->result.has_value();
}

bool MapFuture::poll() {
    if (!is_ready()) {
        device_->poll();
    }
    return is_ready();
}

MapResult MapFuture::wait() {
    while (!is_ready()) {
        if (!device_->poll() && !is_ready()) {
            // Nothing outstanding and still unresolved means the driver dropped the request
            GPUBIND_LOG_WARN(core::LogCategory::Buffer, "Map request was dropped by the driver");
            state_->resolve(core::unexpected(MapError::Aborted));
        }
    }
    std::lock_guard lock(state_->mutex);
    return *state_->result;
}

void MapFuture::on_complete(std::function<void(MapResult)> callback) {
    std::optional<MapResult> ready;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->result.has_value()) {
            ready = state_->result;
        } else {
            state_->callback = std::move(callback);
        }
    }
    if (ready.has_value()) {
        callback(*ready);
    }
}

}  // namespace gpubind::graphics
