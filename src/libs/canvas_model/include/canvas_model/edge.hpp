#pragma once

#include <canvas_model/color.hpp>
#include <canvas_model/types.hpp>
#include <optional>
#include <string>
#include <utility>

namespace canvas_model {

// One end of an edge. Only used to keep the from/to arguments of Edge apart.
struct Terminal {
    Terminal(NodeId node, std::optional<Side> attach_side = std::nullopt,
        std::optional<EndStyle> end_style = std::nullopt)
        : node_id(std::move(node)), side(attach_side), end(end_style_from_optional(end_style))
    {
    }

    NodeId node_id;
    std::optional<Side> side;
    EndStyle end = EndStyle::None;

    bool operator==(const Terminal&) const = default;
};

class Edge {
public:
    Edge(EdgeId id, Terminal from, Terminal to,
        std::optional<Color> color = std::nullopt,
        std::optional<std::string> label = std::nullopt);

    const EdgeId& id() const { return id_; }

    const NodeId& from_node() const { return from_node_; }
    std::optional<Side> from_side() const { return from_side_; }
    EndStyle from_end() const { return from_end_; }

    const NodeId& to_node() const { return to_node_; }
    std::optional<Side> to_side() const { return to_side_; }
    EndStyle to_end() const { return to_end_; }

    const std::optional<Color>& color() const { return color_; }
    const std::optional<std::string>& label() const { return label_; }

    Terminal from() const;
    Terminal to() const;

    bool operator==(const Edge&) const = default;

private:
    EdgeId id_;
    NodeId from_node_;
    std::optional<Side> from_side_;
    EndStyle from_end_ = EndStyle::None;
    NodeId to_node_;
    std::optional<Side> to_side_;
    EndStyle to_end_ = EndStyle::None;
    std::optional<Color> color_;
    std::optional<std::string> label_;
};

} // namespace canvas_model
