#include <canvas_model/edge.hpp>
#include <utility>

namespace canvas_model {

Edge::Edge(EdgeId id, Terminal from, Terminal to,
    std::optional<Color> color, std::optional<std::string> label)
    : id_(std::move(id))
    , from_node_(std::move(from.node_id))
    , from_side_(from.side)
    , from_end_(from.end)
    , to_node_(std::move(to.node_id))
    , to_side_(to.side)
    , to_end_(to.end)
    , color_(std::move(color))
    , label_(std::move(label))
{
}

Terminal Edge::from() const {
    return Terminal(from_node_, from_side_, from_end_);
}

Terminal Edge::to() const {
    return Terminal(to_node_, to_side_, to_end_);
}

} // namespace canvas_model
