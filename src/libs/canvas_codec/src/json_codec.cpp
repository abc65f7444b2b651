#include <canvas_codec/json_codec.hpp>
#include <canvas_codec/logger.hpp>
#include <array>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace canvas_codec {

using namespace canvas_model;

namespace {

template <typename E>
struct WireName {
    E value;
    const char* name;
};

constexpr std::array<WireName<Side>, 4> side_names{{
    { Side::Top, "top" },
    { Side::Right, "right" },
    { Side::Bottom, "bottom" },
    { Side::Left, "left" },
}};

constexpr std::array<WireName<EndStyle>, 2> end_style_names{{
    { EndStyle::None, "none" },
    { EndStyle::Arrow, "arrow" },
}};

constexpr std::array<WireName<BackgroundStyle>, 3> background_style_names{{
    { BackgroundStyle::Cover, "cover" },
    { BackgroundStyle::Ratio, "ratio" },
    { BackgroundStyle::Repeat, "repeat" },
}};

template <typename E, std::size_t N>
const char* name_of(const std::array<WireName<E>, N>& table, E value) {
    for (const auto& entry : table)
        if (entry.value == value) return entry.name;
    return "";
}

template <typename E, std::size_t N>
std::optional<E> value_of(const std::array<WireName<E>, N>& table, std::string_view name) {
    for (const auto& entry : table)
        if (name == entry.name) return entry.value;
    return std::nullopt;
}

std::string child(const std::string& where, std::string_view key) {
    std::string out = where;
    out += '/';
    out += key;
    return out;
}

std::string child(const std::string& where, std::size_t index) {
    return where + "/" + std::to_string(index);
}

// Null counts as absent for every optional field.
const Json* find_field(const Json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

const Json& require_field(const Json& obj, const char* key, const std::string& where) {
    const Json* v = find_field(obj, key);
    if (!v) throw DecodeError(where, std::string("missing required field '") + key + "'");
    return *v;
}

void require_object(const Json& j, const std::string& where) {
    if (!j.is_object())
        throw DecodeError(where, std::string("expected object, got ") + j.type_name());
}

std::string as_string(const Json& v, const std::string& where) {
    if (!v.is_string())
        throw DecodeError(where, std::string("expected string, got ") + v.type_name());
    return v.get<std::string>();
}

std::string require_string(const Json& obj, const char* key, const std::string& where) {
    return as_string(require_field(obj, key, where), child(where, key));
}

std::optional<std::string> optional_string(const Json& obj, const char* key, const std::string& where) {
    const Json* v = find_field(obj, key);
    if (!v) return std::nullopt;
    return as_string(*v, child(where, key));
}

Coord require_coord(const Json& obj, const char* key, const std::string& where) {
    const Json& v = require_field(obj, key, where);
    if (!v.is_number_integer())
        throw DecodeError(child(where, key), std::string("expected integer, got ") + v.type_name());
    if (v.is_number_unsigned()
        && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<Coord>::max()))
        throw DecodeError(child(where, key), "coordinate out of range");
    return v.get<Coord>();
}

Length require_length(const Json& obj, const char* key, const std::string& where) {
    const Json& v = require_field(obj, key, where);
    if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<std::int64_t>() < 0))
        throw DecodeError(child(where, key), "expected non-negative integer");
    return v.get<Length>();
}

template <typename E, std::size_t N>
std::optional<E> optional_enum(const Json& obj, const char* key, const std::string& where,
    const std::array<WireName<E>, N>& table)
{
    const Json* v = find_field(obj, key);
    if (!v) return std::nullopt;
    const std::string name = as_string(*v, child(where, key));
    auto value = value_of(table, name);
    if (!value) throw DecodeError(child(where, key), "unknown value '" + name + "'");
    return value;
}

Color decode_color_at(const Json& v, const std::string& where) {
    if (v.is_number_integer()) {
        std::optional<PresetColor> preset;
        if (!v.is_number_unsigned() || v.get<std::uint64_t>() <= 6)
            preset = preset_color_from_int(v.get<std::int64_t>());
        if (!preset) throw DecodeError(where, "preset color must be between 1 and 6, got " + v.dump());
        return *preset;
    }
    if (v.is_string()) {
        const auto& text = v.get_ref<const std::string&>();
        auto hex = HexColor::parse(text);
        if (!hex) throw DecodeError(where, "'" + text + "' is not a #RRGGBB color");
        return *hex;
    }
    throw DecodeError(where, std::string("expected preset number or hex color string, got ") + v.type_name());
}

std::optional<Color> optional_color(const Json& obj, const std::string& where) {
    const Json* v = find_field(obj, "color");
    if (!v) return std::nullopt;
    return decode_color_at(*v, child(where, "color"));
}

// Absolute URL: scheme ":" rest.
bool has_url_scheme(std::string_view url) {
    const auto colon = url.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    auto is_alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    if (!is_alpha(url[0])) return false;
    for (std::size_t i = 1; i < colon; ++i) {
        const char c = url[i];
        if (!is_alpha(c) && !(c >= '0' && c <= '9') && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

GenericNode decode_generic(const Json& j, const std::string& where) {
    GenericNode g;
    g.id = require_string(j, "id", where);
    g.location.x = require_coord(j, "x", where);
    g.location.y = require_coord(j, "y", where);
    g.dimensions.width = require_length(j, "width", where);
    g.dimensions.height = require_length(j, "height", where);
    g.color = optional_color(j, where);
    return g;
}

Node decode_node_at(const Json& j, const std::string& where) {
    require_object(j, where);
    const std::string type = require_string(j, "type", where);

    if (type == "text") {
        GenericNode g = decode_generic(j, where);
        return TextNode(std::move(g), require_string(j, "text", where));
    }
    if (type == "file") {
        GenericNode g = decode_generic(j, where);
        std::filesystem::path file = require_string(j, "file", where);
        return FileNode(std::move(g), std::move(file), optional_string(j, "subpath", where));
    }
    if (type == "link") {
        GenericNode g = decode_generic(j, where);
        std::string url = require_string(j, "url", where);
        if (!has_url_scheme(url))
            throw DecodeError(child(where, "url"), "'" + url + "' is not an absolute URL");
        return LinkNode(std::move(g), std::move(url));
    }
    if (type == "group") {
        GenericNode g = decode_generic(j, where);
        std::optional<std::filesystem::path> background;
        if (auto bg = optional_string(j, "background", where)) background = std::move(*bg);
        return GroupNode(std::move(g),
            optional_string(j, "label", where),
            std::move(background),
            optional_enum(j, "backgroundStyle", where, background_style_names));
    }
    throw DecodeError(child(where, "type"), "unknown node type '" + type + "'");
}

Edge decode_edge_at(const Json& j, const std::string& where) {
    require_object(j, where);
    std::string id = require_string(j, "id", where);

    Terminal from(require_string(j, "fromNode", where),
        optional_enum(j, "fromSide", where, side_names),
        optional_enum(j, "fromEnd", where, end_style_names));
    Terminal to(require_string(j, "toNode", where),
        optional_enum(j, "toSide", where, side_names),
        optional_enum(j, "toEnd", where, end_style_names));

    return Edge(std::move(id), std::move(from), std::move(to),
        optional_color(j, where), optional_string(j, "label", where));
}

// A missing or null collection is read as an empty array.
const Json& normalized_collection(const Json& doc, const char* key) {
    static const Json empty = Json::array();
    const Json* v = find_field(doc, key);
    if (!v) return empty;
    if (!v->is_array())
        throw DecodeError(child("", key), std::string("expected array, got ") + v->type_name());
    return *v;
}

void put_generic(Json& out, const GenericNode& g) {
    out["id"] = g.id;
    out["x"] = g.location.x;
    out["y"] = g.location.y;
    out["width"] = g.dimensions.width;
    out["height"] = g.dimensions.height;
    if (g.color) out["color"] = encode_color(*g.color);
}

void put_payload(Json& out, const TextNode& n) {
    out["text"] = n.text();
}

void put_payload(Json& out, const FileNode& n) {
    out["file"] = n.file().generic_string();
    if (n.subpath()) out["subpath"] = *n.subpath();
}

void put_payload(Json& out, const LinkNode& n) {
    out["url"] = n.url();
}

void put_payload(Json& out, const GroupNode& n) {
    if (n.label()) out["label"] = *n.label();
    if (n.background()) out["background"] = n.background()->generic_string();
    if (n.background_style()) out["backgroundStyle"] = to_wire_name(*n.background_style());
}

} // namespace

const char* to_wire_name(Side side) {
    return name_of(side_names, side);
}

const char* to_wire_name(EndStyle style) {
    return name_of(end_style_names, style);
}

const char* to_wire_name(BackgroundStyle style) {
    return name_of(background_style_names, style);
}

std::optional<Side> side_from_wire_name(std::string_view name) {
    return value_of(side_names, name);
}

std::optional<EndStyle> end_style_from_wire_name(std::string_view name) {
    return value_of(end_style_names, name);
}

std::optional<BackgroundStyle> background_style_from_wire_name(std::string_view name) {
    return value_of(background_style_names, name);
}

Json encode_color(const Color& color) {
    if (const auto* preset = std::get_if<PresetColor>(&color))
        return preset_color_to_int(*preset);
    return std::get<HexColor>(color).to_string();
}

Json encode_node(const Node& node) {
    Json out = Json::object();
    out["type"] = to_string(node.kind());
    put_generic(out, node.generic());
    std::visit([&out](const auto& n) { put_payload(out, n); }, node.value());
    return out;
}

Json encode_edge(const Edge& edge) {
    Json out = Json::object();
    out["id"] = edge.id();
    out["fromNode"] = edge.from_node();
    if (edge.from_side()) out["fromSide"] = to_wire_name(*edge.from_side());
    if (auto end = end_style_to_optional(edge.from_end())) out["fromEnd"] = to_wire_name(*end);
    out["toNode"] = edge.to_node();
    if (edge.to_side()) out["toSide"] = to_wire_name(*edge.to_side());
    if (auto end = end_style_to_optional(edge.to_end())) out["toEnd"] = to_wire_name(*end);
    if (edge.color()) out["color"] = encode_color(*edge.color());
    if (edge.label()) out["label"] = *edge.label();
    return out;
}

Json encode_canvas(const Canvas& canvas) {
    Json nodes = Json::array();
    for (const auto& n : canvas.nodes())
        nodes.push_back(encode_node(n));

    Json edges = Json::array();
    for (const auto& e : canvas.edges())
        edges.push_back(encode_edge(e));

    Json out = Json::object();
    out["nodes"] = std::move(nodes);
    out["edges"] = std::move(edges);
    return out;
}

Color decode_color(const Json& j) {
    return decode_color_at(j, "");
}

Node decode_node(const Json& j) {
    return decode_node_at(j, "");
}

Edge decode_edge(const Json& j) {
    return decode_edge_at(j, "");
}

Canvas decode_canvas(const Json& j) {
    if (!j.is_object())
        throw DecodeError("", std::string("canvas must be a JSON object, got ") + j.type_name());

    const Json& node_array = normalized_collection(j, "nodes");
    const Json& edge_array = normalized_collection(j, "edges");

    std::vector<Node> nodes;
    nodes.reserve(node_array.size());
    for (std::size_t i = 0; i < node_array.size(); ++i)
        nodes.push_back(decode_node_at(node_array[i], child("/nodes", i)));

    std::vector<Edge> edges;
    edges.reserve(edge_array.size());
    for (std::size_t i = 0; i < edge_array.size(); ++i)
        edges.push_back(decode_edge_at(edge_array[i], child("/edges", i)));

    logger()->debug("Decoded canvas: {} nodes, {} edges", nodes.size(), edges.size());
    return Canvas(std::move(nodes), std::move(edges));
}

std::string to_json_string(const Canvas& canvas, int indent) {
    return encode_canvas(canvas).dump(indent);
}

Canvas from_json_string(std::string_view text) {
    Json j;
    try {
        j = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw DecodeError("", e.what());
    }
    return decode_canvas(j);
}

} // namespace canvas_codec
