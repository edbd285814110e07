#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace speak {

// The library logger, named "speakxx", writing to stderr.
std::shared_ptr<spdlog::logger> const& logger();

// Parse a level name ("trace", "debug", "info", "warn", "error",
// "critical", "off") and apply it to the library logger.
void setLogLevel(std::string_view level);

}  // namespace speak
