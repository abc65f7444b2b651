#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace canvas_model {

using NodeId = std::string;
using EdgeId = std::string;
using Coord = std::int64_t;
using Length = std::uint64_t;

struct Location {
    Coord x = 0;
    Coord y = 0;

    bool operator==(const Location&) const = default;
};

struct Dimensions {
    Length width = 0;
    Length height = 0;

    bool operator==(const Dimensions&) const = default;
};

enum class Side { Top, Right, Bottom, Left };

// None is the implicit default and is written by omitting the field.
enum class EndStyle { None, Arrow };

enum class BackgroundStyle { Cover, Ratio, Repeat };

inline std::optional<EndStyle> end_style_to_optional(EndStyle style) {
    if (style == EndStyle::None) return std::nullopt;
    return style;
}

inline EndStyle end_style_from_optional(std::optional<EndStyle> style) {
    return style.value_or(EndStyle::None);
}

} // namespace canvas_model
