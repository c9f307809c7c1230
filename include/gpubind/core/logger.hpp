// GpuBind Core
// logger.hpp - Categorized logging on top of spdlog

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace gpubind::core {

class Config;

// Same order as spdlog::level::level_enum
enum class LogLevel : uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

// Subsystem a message belongs to, each with its own threshold
enum class LogCategory : uint8_t {
    Core,
    Config,
    Driver,
    Device,
    Buffer,
    Texture,
    Command,
    Query,
    Count
};

inline constexpr size_t LOG_CATEGORY_COUNT = static_cast<size_t>(LogCategory::Count);

// Accepts spdlog's level names ("warn" and "warning" both work). Unknown names yield the fallback.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);
[[nodiscard]] const char* to_string(LogLevel level);

[[nodiscard]] std::optional<LogCategory> parse_log_category(std::string_view name);
[[nodiscard]] const char* to_string(LogCategory category);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_directory;  // Empty keeps output on the console
    std::string log_filename = "gpubind.log";
    size_t max_file_size = 4 * 1024 * 1024;
    size_t max_files = 2;
    bool colored_output = true;
    std::vector<std::pair<LogCategory, LogLevel>> category_levels;

    // Reads the [logging] section, see Config::logging_settings
    [[nodiscard]] static LoggerConfig from_config(const Config& config);
};

class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_level(LogCategory category, LogLevel level);
    [[nodiscard]] static LogLevel level(LogCategory category);

    // Applies to every category and to the console sink
    static void set_global_level(LogLevel level);

    static void flush();

    template<typename... Args>
    static void log(LogLevel level, LogCategory category, fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        write(level, category, fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    Logger() = delete;

    [[nodiscard]] static bool should_log(LogLevel level, LogCategory category);
    static void write(LogLevel level, LogCategory category, std::string_view message);
};

}  // namespace gpubind::core

#define GPUBIND_LOG_TRACE(category, ...) \
    ::gpubind::core::Logger::log(::gpubind::core::LogLevel::Trace, category, __VA_ARGS__)

#define GPUBIND_LOG_DEBUG(category, ...) \
    ::gpubind::core::Logger::log(::gpubind::core::LogLevel::Debug, category, __VA_ARGS__)

#define GPUBIND_LOG_INFO(category, ...) \
    ::gpubind::core::Logger::log(::gpubind::core::LogLevel::Info, category, __VA_ARGS__)

#define GPUBIND_LOG_WARN(category, ...) \
    ::gpubind::core::Logger::log(::gpubind::core::LogLevel::Warn, category, __VA_ARGS__)

#define GPUBIND_LOG_ERROR(category, ...) \
    ::gpubind::core::Logger::log(::gpubind::core::LogLevel::Error, category, __VA_ARGS__)

#define GPUBIND_LOG_CRITICAL(category, ...) \
    ::gpubind::core::Logger::log(::gpubind::core::LogLevel::Critical, category, __VA_ARGS__)
