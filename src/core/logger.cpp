// GpuBind Core
// logger.cpp - Logging implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <array>
#include <atomic>
#include <gpubind/core/config.hpp>
#include <gpubind/core/logger.hpp>
#include <mutex>

namespace gpubind::core {

namespace {

constexpr std::array<const char*, LOG_CATEGORY_COUNT> CATEGORY_NAMES = {
    "gpubind", "config", "driver", "device", "buffer", "texture", "command", "query",
};

// Thresholds are read on every log call without taking the mutex
struct LoggerState {
    std::array<std::atomic<LogLevel>, LOG_CATEGORY_COUNT> levels;
    std::shared_ptr<spdlog::logger> logger;
    std::mutex mutex;

    LoggerState() {
        for (auto& level : levels) {
            level.store(LogLevel::Info, std::memory_order_relaxed);
        }
    }

    std::atomic<LogLevel>& level_of(LogCategory category) { return levels[static_cast<size_t>(category)]; }
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(static_cast<int>(level));
}

std::shared_ptr<spdlog::logger> make_logger(const LoggerConfig& config, std::filesystem::path& log_path) {
    std::vector<spdlog::sink_ptr> sinks;

    spdlog::sink_ptr console;
    if (config.colored_output) {
        console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        console = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    console->set_level(to_spdlog(config.console_level));
    console->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    sinks.push_back(std::move(console));

    if (!config.log_directory.empty()) {
        std::filesystem::create_directories(config.log_directory);
        log_path = config.log_directory / config.log_filename;

        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path.string(), config.max_file_size,
                                                                            config.max_files);
        file->set_level(to_spdlog(config.file_level));
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(std::move(file));
    }

    auto logger = std::make_shared<spdlog::logger>("gpubind", sinks.begin(), sinks.end());
    // Sinks filter, the logger passes everything through
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    // spdlog maps unknown names to off
    if (name == "off") {
        return LogLevel::Off;
    }
    auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off) {
        return fallback;
    }
    return static_cast<LogLevel>(static_cast<int>(level));
}

const char* to_string(LogLevel level) {
    return spdlog::level::to_string_view(to_spdlog(level)).data();
}

std::optional<LogCategory> parse_log_category(std::string_view name) {
    for (size_t i = 0; i < CATEGORY_NAMES.size(); ++i) {
        if (name == CATEGORY_NAMES[i]) {
            return static_cast<LogCategory>(i);
        }
    }
    return std::nullopt;
}

const char* to_string(LogCategory category) {
    auto index = static_cast<size_t>(category);
    return index < CATEGORY_NAMES.size() ? CATEGORY_NAMES[index] : "unknown";
}

LoggerConfig LoggerConfig::from_config(const Config& config) {
    auto settings = config.logging_settings();

    LoggerConfig result;
    result.console_level = parse_log_level(settings.level);
    result.log_directory = settings.log_directory;
    for (const auto& [name, level] : settings.category_levels) {
        auto category = parse_log_category(name);
        if (!category) {
            GPUBIND_LOG_WARN(LogCategory::Config, "Ignoring level for unknown log category '{}'", name);
            continue;
        }
        result.category_levels.emplace_back(*category, parse_log_level(level, result.console_level));
    }
    return result;
}

void Logger::initialize(const LoggerConfig& config) {
    auto& s = state();
    std::filesystem::path log_path;

    {
        std::lock_guard lock(s.mutex);
        if (s.logger) {
            return;
        }

        try {
            s.logger = make_logger(config, log_path);
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::error("Log file sink unavailable, logging to the console only: {}", ex.what());
            auto fallback = config;
            fallback.log_directory.clear();
            log_path.clear();
            s.logger = make_logger(fallback, log_path);
        } catch (const std::filesystem::filesystem_error& ex) {
            spdlog::error("Failed to create log directory, logging to the console only: {}", ex.what());
            auto fallback = config;
            fallback.log_directory.clear();
            log_path.clear();
            s.logger = make_logger(fallback, log_path);
        }

        for (auto& level : s.levels) {
            level.store(config.console_level, std::memory_order_relaxed);
        }
        for (const auto& [category, level] : config.category_levels) {
            s.level_of(category).store(level, std::memory_order_relaxed);
        }
    }

    // write() takes the mutex again
    GPUBIND_LOG_DEBUG(LogCategory::Core, "Logger initialized");
    if (!log_path.empty()) {
        GPUBIND_LOG_INFO(LogCategory::Core, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.logger) {
        return;
    }
    s.logger->flush();
    s.logger.reset();
    for (auto& level : s.levels) {
        level.store(LogLevel::Info, std::memory_order_relaxed);
    }
}

bool Logger::is_initialized() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.logger != nullptr;
}

void Logger::set_level(LogCategory category, LogLevel level) {
    state().level_of(category).store(level, std::memory_order_relaxed);
}

LogLevel Logger::level(LogCategory category) {
    return state().level_of(category).load(std::memory_order_relaxed);
}

void Logger::set_global_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& category_level : s.levels) {
        category_level.store(level, std::memory_order_relaxed);
    }
    if (s.logger) {
        // The console sink is always first
        s.logger->sinks().front()->set_level(to_spdlog(level));
    }
}

void Logger::flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->flush();
    }
}

bool Logger::should_log(LogLevel level, LogCategory category) {
    if (level == LogLevel::Off) {
        return false;
    }
    return static_cast<int>(level) >= static_cast<int>(state().level_of(category).load(std::memory_order_relaxed));
}

void Logger::write(LogLevel level, LogCategory category, std::string_view message) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    // Before initialize() messages go to spdlog's default logger
    auto& logger = s.logger ? *s.logger : *spdlog::default_logger_raw();
    logger.log(to_spdlog(level), "[{}] {}", to_string(category), message);
}

}  // namespace gpubind::core
