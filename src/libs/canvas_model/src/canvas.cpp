#include <canvas_model/canvas.hpp>
#include <utility>

namespace canvas_model {

namespace {

template <typename Range, typename IdOf>
std::unordered_set<std::string> collect_duplicates(const Range& items, IdOf id_of) {
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> out;
    for (const auto& item : items) {
        const auto& id = id_of(item);
        if (!seen.insert(id).second) out.insert(id);
    }
    return out;
}

} // namespace

Canvas::Canvas(std::vector<Node> nodes, std::vector<Edge> edges)
    : nodes_(std::move(nodes)), edges_(std::move(edges))
{
}

std::unordered_set<NodeId> Canvas::unknown_nodes() const {
    std::unordered_set<NodeId> out;
    for (const auto& e : edges_) {
        out.insert(e.from_node());
        out.insert(e.to_node());
    }
    for (const auto& n : nodes_) {
        if (out.empty()) break;
        out.erase(n.id());
    }
    return out;
}

std::unordered_set<NodeId> Canvas::duplicate_node_ids() const {
    return collect_duplicates(nodes_, [](const Node& n) -> const NodeId& { return n.id(); });
}

std::unordered_set<EdgeId> Canvas::duplicate_edge_ids() const {
    return collect_duplicates(edges_, [](const Edge& e) -> const EdgeId& { return e.id(); });
}

const Node* Canvas::find_node(std::string_view id) const {
    for (const auto& n : nodes_)
        if (n.id() == id) return &n;
    return nullptr;
}

const Edge* Canvas::find_edge(std::string_view id) const {
    for (const auto& e : edges_)
        if (e.id() == id) return &e;
    return nullptr;
}

} // namespace canvas_model
