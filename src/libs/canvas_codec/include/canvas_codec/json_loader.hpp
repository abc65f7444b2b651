#pragma once

#include <canvas_model/canvas.hpp>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace canvas_codec {

inline constexpr int default_indent = 2;

// On failure the reason is logged and, when error is given, stored there.
std::optional<canvas_model::Canvas> load_canvas_from_json(std::istream& in, std::string* error = nullptr);
std::optional<canvas_model::Canvas> load_canvas_from_json_file(const std::filesystem::path& path,
    std::string* error = nullptr);

// Returns false, without writing, when the canvas holds strings that are not valid UTF-8.
bool save_canvas_to_json(const canvas_model::Canvas& canvas, std::ostream& out, int indent = default_indent,
    std::string* error = nullptr);
bool save_canvas_to_json_file(const canvas_model::Canvas& canvas, const std::filesystem::path& path,
    int indent = default_indent, std::string* error = nullptr);

} // namespace canvas_codec
