#include <canvas_codec/json_loader.hpp>
#include <canvas_codec/json_codec.hpp>
#include <canvas_codec/logger.hpp>
#include <fstream>

namespace canvas_codec {

namespace {

void report(std::string* error, const std::string& message) {
    logger()->warn("{}", message);
    if (error) *error = message;
}

} // namespace

std::optional<canvas_model::Canvas> load_canvas_from_json(std::istream& in, std::string* error) {
    try {
        Json j = Json::parse(in);
        return decode_canvas(j);
    } catch (const Json::parse_error& e) {
        report(error, std::string("Malformed canvas JSON: ") + e.what());
    } catch (const DecodeError& e) {
        report(error, std::string("Invalid canvas: ") + e.what());
    }
    return std::nullopt;
}

std::optional<canvas_model::Canvas> load_canvas_from_json_file(const std::filesystem::path& path,
    std::string* error)
{
    std::ifstream f(path);
    if (!f) {
        report(error, "Cannot open canvas file " + path.string());
        return std::nullopt;
    }
    auto canvas = load_canvas_from_json(f, error);
    if (canvas) {
        logger()->debug("Loaded {} ({} nodes, {} edges)", path.string(),
            canvas->nodes().size(), canvas->edges().size());
    } else if (error) {
        *error = path.string() + ": " + *error;
    }
    return canvas;
}

bool save_canvas_to_json(const canvas_model::Canvas& canvas, std::ostream& out, int indent,
    std::string* error)
{
    std::string text;
    try {
        text = to_json_string(canvas, indent);
    } catch (const Json::type_error& e) {
        report(error, std::string("Cannot encode canvas: ") + e.what());
        return false;
    }
    out << text;
    if (indent >= 0) out << '\n';
    if (!out) {
        report(error, "Failed writing canvas to stream");
        return false;
    }
    return true;
}

bool save_canvas_to_json_file(const canvas_model::Canvas& canvas, const std::filesystem::path& path,
    int indent, std::string* error)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        report(error, "Cannot open " + path.string() + " for writing");
        return false;
    }
    if (!save_canvas_to_json(canvas, f, indent, error)) {
        if (error) *error = path.string() + ": " + *error;
        return false;
    }
    return true;
}

} // namespace canvas_codec
