// canvas_check: load a .canvas document, report integrity problems, optionally re-encode it.

#include <canvas_codec/json_loader.hpp>
#include <canvas_codec/logger.hpp>
#include <canvas_model/canvas.hpp>
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace {

struct Options {
    std::string path;
    bool print = false;
    bool strict = false;
    int indent = canvas_codec::default_indent;
    spdlog::level::level_enum level = spdlog::level::info;
};

void print_usage(const char* argv0) {
    (void)fprintf(stderr,
        "usage: %s [--print] [--indent N] [--strict] [--verbose|--quiet] <file.canvas>\n", argv0);
}

bool parse_options(int argc, char* argv[], Options& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--print") {
            out.print = true;
        } else if (arg == "--strict") {
            out.strict = true;
        } else if (arg == "--verbose") {
            out.level = spdlog::level::debug;
        } else if (arg == "--quiet") {
            out.level = spdlog::level::err;
        } else if (arg == "--indent") {
            if (++i >= argc) return false;
            const std::string_view value(argv[i]);
            const auto res = std::from_chars(value.data(), value.data() + value.size(), out.indent);
            if (res.ec != std::errc() || res.ptr != value.data() + value.size()) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            return false;
        } else if (out.path.empty()) {
            out.path = std::string(arg);
        } else {
            return false;
        }
    }
    return !out.path.empty();
}

std::vector<std::string> sorted(const std::unordered_set<std::string>& ids) {
    std::vector<std::string> out(ids.begin(), ids.end());
    std::sort(out.begin(), out.end());
    return out;
}

// Logs one warning per id, returns the number of ids reported.
std::size_t warn_ids(const std::unordered_set<std::string>& ids, const char* what) {
    for (const auto& id : sorted(ids))
        canvas_codec::logger()->warn("{}: {}", what, id);
    return ids.size();
}

} // namespace

int main(int argc, char* argv[])
{
    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return 1;
    }

    auto log = canvas_codec::logger();
    log->set_level(options.level);

    std::string error;
    auto canvas = canvas_codec::load_canvas_from_json_file(options.path, &error);
    if (!canvas) {
        log->error("{}", error);
        return 1;
    }
    log->info("{}: {} nodes, {} edges", options.path, canvas->nodes().size(), canvas->edges().size());

    std::size_t problems = 0;
    problems += warn_ids(canvas->unknown_nodes(), "Edge references unknown node");
    problems += warn_ids(canvas->duplicate_node_ids(), "Duplicate node id");
    problems += warn_ids(canvas->duplicate_edge_ids(), "Duplicate edge id");

    if (options.print && !canvas_codec::save_canvas_to_json(*canvas, std::cout, options.indent)) {
        log->error("Failed to write canvas to stdout");
        return 1;
    }

    if (problems > 0 && options.strict) {
        log->error("{} integrity problem(s) found", problems);
        return 2;
    }
    return 0;
}
