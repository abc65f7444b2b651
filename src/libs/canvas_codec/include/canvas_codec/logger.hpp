#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace canvas_codec {

inline constexpr const char* logger_name = "json_canvas";

// Shared stderr logger for the codec and the tools built on it. Created on first use.
std::shared_ptr<spdlog::logger> logger();

} // namespace canvas_codec
