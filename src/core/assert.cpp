// GpuBind Core
// assert.cpp - Contract violation reporting

#include <cstdio>
#include <cstdlib>
#include <gpubind/core/assert.hpp>
#include <gpubind/core/logger.hpp>
#include <string>

namespace gpubind::core {

namespace {

[[noreturn]] void fail(std::string_view kind, std::string_view message, const std::source_location& where) {
    std::string line = fmt::format("[{}] {} @ {}:{} ({})", kind, message.empty() ? "<no message>" : message,
                                   where.file_name(), where.line(), where.function_name());

    GPUBIND_LOG_CRITICAL(LogCategory::Core, "{}", line);
    Logger::flush();

    // The console sink writes to stdout, the process is about to die
    fmt::print(stderr, "{}\n", line);
    std::fflush(stderr);

    std::abort();
}

}  // namespace

void fatal_error(std::string_view message, std::source_location where) {
    fail("fatal", message, where);
}

namespace detail {

void assert_failed(std::string_view condition, std::string_view message, std::source_location where) {
    fail("assert", fmt::format("{} (`{}`)", message, condition), where);
}

}  // namespace detail

}  // namespace gpubind::core
