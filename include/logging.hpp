/*
 * Wire Router Core - Logging
 * Part of the schematic wire routing engine
 */

#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace wireroute {
namespace log {

// Shared "wireroute" logger, created on first use (stderr, level warn)
std::shared_ptr<spdlog::logger> get();

// Route engine messages into a host application's logger
void set_logger(std::shared_ptr<spdlog::logger> logger);

void set_level(spdlog::level::level_enum level);

}  // namespace log
}  // namespace wireroute
