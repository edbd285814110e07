#include "log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace speak {

std::shared_ptr<spdlog::logger> const& logger() {
    static auto const lg = [] {
        auto existing = spdlog::get("speakxx");
        if (existing != nullptr) return existing;
        auto created = spdlog::stderr_color_mt("speakxx");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return lg;
}

void setLogLevel(std::string_view level) {
    auto lvl = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off".
    if (lvl == spdlog::level::off && level != "off") {
        throw std::invalid_argument("unknown log level: " +
                                    std::string(level));
    }
    logger()->set_level(lvl);
}

}  // namespace speak
