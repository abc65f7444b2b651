#pragma once

#include <canvas_codec/decode_error.hpp>
#include <canvas_model/canvas.hpp>
#include <canvas_model/color.hpp>
#include <canvas_model/edge.hpp>
#include <canvas_model/node.hpp>
#include <canvas_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace canvas_codec {

// Keeps keys in schema order on encode.
using Json = nlohmann::ordered_json;

// Wire names of the enumerations ("top", "arrow", "cover", ...).
const char* to_wire_name(canvas_model::Side side);
const char* to_wire_name(canvas_model::EndStyle style);
const char* to_wire_name(canvas_model::BackgroundStyle style);
std::optional<canvas_model::Side> side_from_wire_name(std::string_view name);
std::optional<canvas_model::EndStyle> end_style_from_wire_name(std::string_view name);
std::optional<canvas_model::BackgroundStyle> background_style_from_wire_name(std::string_view name);

// Presets encode as the integers 1..6, hex colors as "#RRGGBB".
Json encode_color(const canvas_model::Color& color);
Json encode_node(const canvas_model::Node& node);
Json encode_edge(const canvas_model::Edge& edge);
// Always writes both "nodes" and "edges" as arrays.
Json encode_canvas(const canvas_model::Canvas& canvas);

// All decoders throw DecodeError on schema violations.
canvas_model::Color decode_color(const Json& j);
canvas_model::Node decode_node(const Json& j);
canvas_model::Edge decode_edge(const Json& j);
// Missing or null "nodes"/"edges" decode as empty.
canvas_model::Canvas decode_canvas(const Json& j);

// indent < 0 gives the compact form. Throws Json::type_error when a string is not valid UTF-8.
std::string to_json_string(const canvas_model::Canvas& canvas, int indent = -1);
// Throws DecodeError, also for text that is not JSON.
canvas_model::Canvas from_json_string(std::string_view text);

} // namespace canvas_codec
