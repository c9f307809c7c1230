// GpuBind Core
// config.hpp - JSON-based configuration

#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gpubind::core {

namespace config_section {
    inline constexpr const char* DEVICE = "device";
    inline constexpr const char* LOGGING = "logging";
}  // namespace config_section

namespace config_key {
    // Device section
    inline constexpr const char* BACKEND = "backend";
    inline constexpr const char* MAPPING_MODE = "mapping_mode";
    inline constexpr const char* LABEL = "label";

    // Logging section
    inline constexpr const char* LOG_LEVEL = "level";
    inline constexpr const char* LOG_DIRECTORY = "log_directory";
    inline constexpr const char* LOG_CATEGORIES = "categories";
}  // namespace config_key

// The [device] section
struct DeviceSettings {
    std::string backend = "host";
    std::string mapping_mode = "direct";  // "direct" or "staged"
    std::string label = "gpubind";
};

// The [logging] section. Category levels are keyed by category name, e.g. {"command": "trace"}.
struct LoggingSettings {
    std::string level = "info";
    std::filesystem::path log_directory;
    std::map<std::string, std::string> category_levels;
};

// Sectioned configuration persisted as a JSON object of objects.
// Sections and keys the library does not know about survive a load/save cycle.
class Config {
public:
    Config();

    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view json_text);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // To the path last loaded from
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // The value converted to T, or nullopt when missing or of another JSON type
    template<typename T>
    [[nodiscard]] std::optional<T> find(std::string_view section, std::string_view key) const {
        const nlohmann::json* value = lookup(section, key);
        if (value == nullptr || !holds<T>(*value)) {
            return std::nullopt;
        }
        return value->get<T>();
    }

    template<typename T>
    [[nodiscard]] T get(std::string_view section, std::string_view key, T fallback) const {
        return find<T>(section, key).value_or(std::move(fallback));
    }

    [[nodiscard]] std::string get(std::string_view section, std::string_view key, const char* fallback) const {
        return get<std::string>(section, key, fallback);
    }

    template<typename T>
    void set(std::string_view section, std::string_view key, T&& value) {
        data_[std::string(section)][std::string(key)] = std::forward<T>(value);
        notify_changed(section, key);
    }

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);
    bool remove_section(std::string_view section);

    [[nodiscard]] DeviceSettings device_settings() const;
    [[nodiscard]] LoggingSettings logging_settings() const;
    void set_device_settings(const DeviceSettings& settings);

    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const { return dirty_; }
    void mark_clean() { dirty_ = false; }

    void set_defaults();

private:
    template<typename T>
    static bool holds(const nlohmann::json& value) {
        if constexpr (std::is_same_v<T, bool>) {
            return value.is_boolean();
        } else if constexpr (std::is_integral_v<T>) {
            return value.is_number_integer();
        } else if constexpr (std::is_floating_point_v<T>) {
            return value.is_number();
        } else if constexpr (std::is_convertible_v<T, std::string_view>) {
            return value.is_string();
        } else {
            return !value.is_null();
        }
    }

    [[nodiscard]] const nlohmann::json* lookup(std::string_view section, std::string_view key) const;
    void notify_changed(std::string_view section, std::string_view key);

    nlohmann::json data_;
    std::filesystem::path path_;
    ChangeCallback change_callback_;
    bool dirty_ = false;
};

}  // namespace gpubind::core
