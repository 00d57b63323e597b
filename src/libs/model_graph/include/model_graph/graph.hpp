#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace model_graph {

struct AttributeRecord {
    int id = 0;
    std::string name;
    std::string type;
    std::string default_value;
};

struct Position {
    std::optional<int> left;
    std::optional<int> right;
    std::optional<int> top;
    std::optional<int> bottom;
};

// Entry of a diagram's element list. The node itself lives once in Graph::nodes.
// Only the listing whose placement built the element carries it in full; every
// later listing (including one reached while the element was still being built)
// is a reference.
struct DiagramMember {
    int element_id = 0;
    bool reference = false;
};

struct DiagramNode {
    int diagram_id = 0;
    std::string name;
    std::vector<DiagramMember> elements;
};

struct ElementNode {
    int id = 0;
    std::string name;
    std::string type;
    std::vector<AttributeRecord> attributes;
    std::vector<DiagramNode> linked_diagrams;
    // Set only when the element was first reached through a diagram placement.
    std::optional<Position> position;
};

// Classifier referenced from outside the traversal; never expanded.
struct ExternalNode {
    int id = 0;
    std::string name;
    std::string type;
    std::optional<std::string> package;
    std::vector<AttributeRecord> attributes;
};

struct PackageNode {
    std::string name;
    std::vector<DiagramNode> diagrams;
};

using GraphNode = std::variant<PackageNode, ElementNode, ExternalNode>;

struct Edge {
    int from = 0;
    int to = 0;
    std::string type;
    std::string name;
};

struct Graph {
    std::vector<GraphNode> nodes;
    std::vector<Edge> edges;
};

inline std::string diagram_node_id(int diagram_id) {
    return "D" + std::to_string(diagram_id);
}

// Id of an element or external node; nullopt for the package node.
inline std::optional<int> node_element_id(const GraphNode& node) {
    if (const auto* e = std::get_if<ElementNode>(&node)) return e->id;
    if (const auto* x = std::get_if<ExternalNode>(&node)) return x->id;
    return std::nullopt;
}

} // namespace model_graph
