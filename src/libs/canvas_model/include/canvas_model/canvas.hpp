#pragma once

#include <canvas_model/edge.hpp>
#include <canvas_model/node.hpp>
#include <canvas_model/types.hpp>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace canvas_model {

// A whole canvas document. Node and edge ids are expected to be unique; that is
// not enforced, see duplicate_node_ids() / duplicate_edge_ids().
class Canvas {
public:
    Canvas() = default;
    Canvas(std::vector<Node> nodes, std::vector<Edge> edges);

    const std::vector<Node>& nodes() const { return nodes_; }
    std::vector<Node>& nodes_mut() { return nodes_; }

    const std::vector<Edge>& edges() const { return edges_; }
    std::vector<Edge>& edges_mut() { return edges_; }

    // Ids referenced by an edge end that no node in the canvas declares.
    std::unordered_set<NodeId> unknown_nodes() const;

    std::unordered_set<NodeId> duplicate_node_ids() const;
    std::unordered_set<EdgeId> duplicate_edge_ids() const;

    // First match wins when ids are duplicated.
    const Node* find_node(std::string_view id) const;
    const Edge* find_edge(std::string_view id) const;

    bool operator==(const Canvas&) const = default;

private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
};

} // namespace canvas_model
