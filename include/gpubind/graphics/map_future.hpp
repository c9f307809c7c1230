// GpuBind Graphics Layer
// map_future.hpp - Completion handle of an asynchronous buffer map

#pragma once

#include <gpubind/core/result.hpp>
#include <gpubind/driver/types.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace gpubind::driver {
class Device;
}

namespace gpubind::graphics {

enum class MapError : uint8_t {
    DeviceLost,
    Destroyed,
    Aborted,
    Unknown,
};

[[nodiscard]] const char* to_string(MapError error);

using MapResult = core::Result<void, MapError>;

[[nodiscard]] MapResult map_result_from_status(driver::MapStatus status);

namespace detail {

// Shared between a MapFuture and the driver callback. The callback only holds
// a weak reference, so a dropped future turns the completion into a no-op.
struct MapRequestState {
    std::mutex mutex;
    std::optional<MapResult> result;
    std::function<void(MapResult)> callback;

    void resolve(MapResult result_value);
};

}  // namespace detail

class [[nodiscard]] MapFuture {
public:
    MapFuture(std::shared_ptr<driver::Device> device, std::shared_ptr<detail::MapRequestState> state);

    MapFuture(MapFuture&&) noexcept = default;
    MapFuture& operator=(MapFuture&&) noexcept = default;
    MapFuture(const MapFuture&) = delete;
    MapFuture& operator=(const MapFuture&) = delete;

    [[nodiscard]] bool is_ready() const;

    // Polls the device once, returns is_ready()
    bool poll();

    // Polls the device until the request resolves
    MapResult wait();

    // Runs immediately when already resolved, otherwise from the device poll that resolves it
    void on_complete(std::function<void(MapResult)> callback);

private:
    std::shared_ptr<driver::Device> device_;
    std::shared_ptr<detail::MapRequestState> state_;
};

}  // namespace gpubind::graphics
