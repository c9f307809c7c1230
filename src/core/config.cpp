// GpuBind Core
// config.cpp - JSON-based configuration implementation

#include <fstream>
#include <gpubind/core/config.hpp>
#include <gpubind/core/logger.hpp>
#include <iterator>
#include <system_error>

namespace gpubind::core {

using json = nlohmann::json;

Config::Config() {
    set_defaults();
    dirty_ = false;
}

bool Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        GPUBIND_LOG_ERROR(LogCategory::Config, "Failed to read config file: {}", path.string());
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!load_from_string(text)) {
        return false;
    }
    path_ = path;
    GPUBIND_LOG_INFO(LogCategory::Config, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view json_text) {
    auto parsed = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        GPUBIND_LOG_ERROR(LogCategory::Config, "Config is not valid JSON");
        return false;
    }
    if (!parsed.is_object()) {
        GPUBIND_LOG_ERROR(LogCategory::Config, "Config root must be a JSON object");
        return false;
    }

    // Loaded values override defaults key by key, a null removes the key
    set_defaults();
    data_.merge_patch(parsed);
    dirty_ = false;
    return true;
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            GPUBIND_LOG_ERROR(LogCategory::Config, "Failed to create config directory {}: {}", parent.string(),
                              ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    file << data_.dump(4);
    if (!file) {
        GPUBIND_LOG_ERROR(LogCategory::Config, "Failed to write config file: {}", path.string());
        return false;
    }
    GPUBIND_LOG_INFO(LogCategory::Config, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (path_.empty()) {
        GPUBIND_LOG_ERROR(LogCategory::Config, "Cannot save config: it was not loaded from a file");
        return false;
    }
    return save(path_);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    path_ = path;
    if (save(path)) {
        dirty_ = false;
    } else {
        GPUBIND_LOG_WARN(LogCategory::Config, "Using in-memory defaults, {} could not be written", path.string());
    }
    return true;
}

const json* Config::lookup(std::string_view section, std::string_view key) const {
    auto section_it = data_.find(std::string(section));
    if (section_it == data_.end() || !section_it->is_object()) {
        return nullptr;
    }
    auto key_it = section_it->find(std::string(key));
    return key_it == section_it->end() ? nullptr : &*key_it;
}

bool Config::has(std::string_view section, std::string_view key) const {
    return lookup(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return data_.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    data_[std::string(section)].erase(std::string(key));
    dirty_ = true;
    return true;
}

bool Config::remove_section(std::string_view section) {
    if (data_.erase(std::string(section)) == 0) {
        return false;
    }
    dirty_ = true;
    return true;
}

DeviceSettings Config::device_settings() const {
    DeviceSettings settings;
    settings.backend = get(config_section::DEVICE, config_key::BACKEND, settings.backend);
    settings.mapping_mode = get(config_section::DEVICE, config_key::MAPPING_MODE, settings.mapping_mode);
    settings.label = get(config_section::DEVICE, config_key::LABEL, settings.label);
    return settings;
}

LoggingSettings Config::logging_settings() const {
    LoggingSettings settings;
    settings.level = get(config_section::LOGGING, config_key::LOG_LEVEL, settings.level);
    settings.log_directory = get(config_section::LOGGING, config_key::LOG_DIRECTORY, std::string());

    const json* categories = lookup(config_section::LOGGING, config_key::LOG_CATEGORIES);
    if (categories != nullptr && categories->is_object()) {
        for (const auto& [name, level] : categories->items()) {
            if (level.is_string()) {
                settings.category_levels.emplace(name, level.get<std::string>());
            }
        }
    }
    return settings;
}

void Config::set_device_settings(const DeviceSettings& settings) {
    set(config_section::DEVICE, config_key::BACKEND, settings.backend);
    set(config_section::DEVICE, config_key::MAPPING_MODE, settings.mapping_mode);
    set(config_section::DEVICE, config_key::LABEL, settings.label);
}

void Config::set_change_callback(ChangeCallback callback) {
    change_callback_ = std::move(callback);
}

void Config::set_defaults() {
    const DeviceSettings device;
    const LoggingSettings logging;
    data_ = json{
        {config_section::DEVICE,
         {{config_key::BACKEND, device.backend},
          {config_key::MAPPING_MODE, device.mapping_mode},
          {config_key::LABEL, device.label}}},
        {config_section::LOGGING,
         {{config_key::LOG_LEVEL, logging.level},
          {config_key::LOG_DIRECTORY, ""},
          {config_key::LOG_CATEGORIES, json::object()}}},
    };
    dirty_ = true;
}

void Config::notify_changed(std::string_view section, std::string_view key) {
    dirty_ = true;
    if (change_callback_) {
        change_callback_(section, key);
    }
}

}  // namespace gpubind::core
