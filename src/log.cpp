#include "llmtools/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace llmtools {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("llmtools");
        if (!instance) {
            instance = spdlog::stderr_color_mt("llmtools");
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

bool set_log_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"
    bool known = parsed != spdlog::level::off || level == "off";
    logger()->set_level(known ? parsed : spdlog::level::info);
    return known;
}

} // namespace llmtools
