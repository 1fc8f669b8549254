#include "paperdesk/logging.hpp"

#include <atomic>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace paperdesk {

std::shared_ptr<spdlog::logger> make_logger(const std::string& base, const std::string& level) {
    static std::atomic<int> instance_count{0};
    std::string logger_name = base + "_" + std::to_string(instance_count++);
    auto logger = spdlog::stdout_color_mt(logger_name);

    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; keep info unless "off" was asked for.
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    return logger;
}

} // namespace paperdesk
