/*
 * Wire Router Core - Logging Implementation
 * Part of the schematic wire routing engine
 */

#include "logging.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace wireroute {
namespace log {

namespace {

constexpr const char* kLoggerName = "wireroute";

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    logger->set_level(spdlog::level::warn);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = make_default_logger();
    }
    return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = logger ? std::move(logger) : make_default_logger();
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

}  // namespace log
}  // namespace wireroute
