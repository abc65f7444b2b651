#include <canvas_codec/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace canvas_codec {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance;
    if (instance) return instance;

    try {
        instance = spdlog::stderr_color_mt(logger_name);
        instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    } catch (const spdlog::spdlog_ex&) {
        // Registered elsewhere already (or sink creation failed).
        instance = spdlog::get(logger_name);
        if (!instance) instance = spdlog::default_logger();
    }
    return instance;
}

} // namespace canvas_codec
