#include <graph_export/graph_json.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unordered_map>
#include <variant>

namespace graph_export {

namespace {

using json = nlohmann::ordered_json;
using NodeIndex = std::unordered_map<int, const model_graph::GraphNode*>;

json optional_int(const std::optional<int>& v) {
    return v ? json(*v) : json(nullptr);
}

json attributes_json(const std::vector<model_graph::AttributeRecord>& attributes) {
    json out = json::array();
    for (const auto& a : attributes) {
        json j;
        j["id"] = a.id;
        j["name"] = a.name;
        j["type"] = a.type;
        j["default"] = a.default_value;
        out.push_back(std::move(j));
    }
    return out;
}

json position_json(const std::optional<model_graph::Position>& position) {
    if (!position) return nullptr;
    json j;
    j["left"] = optional_int(position->left);
    j["right"] = optional_int(position->right);
    j["top"] = optional_int(position->top);
    j["bottom"] = optional_int(position->bottom);
    return j;
}

json external_json(const model_graph::ExternalNode& node) {
    json j;
    j["id"] = node.id;
    j["name"] = node.name;
    j["type"] = node.type;
    j["package"] = node.package ? json(*node.package) : json(nullptr);
    j["attributes"] = attributes_json(node.attributes);
    return j;
}

json element_json(const model_graph::ElementNode& node, const NodeIndex& index);

json diagram_json(const model_graph::DiagramNode& diagram, const NodeIndex& index) {
    json j;
    j["id"] = model_graph::diagram_node_id(diagram.diagram_id);
    j["name"] = diagram.name;
    j["type"] = "Diagram";
    json elements = json::array();
    for (const auto& member : diagram.elements) {
        auto it = index.find(member.element_id);
        if (it == index.end()) continue;
        const model_graph::GraphNode& node = *it->second;

        if (member.reference) {
            json ref;
            ref["id"] = member.element_id;
            if (const auto* e = std::get_if<model_graph::ElementNode>(&node)) {
                ref["name"] = e->name;
                ref["type"] = e->type;
            } else if (const auto* x = std::get_if<model_graph::ExternalNode>(&node)) {
                ref["name"] = x->name;
                ref["type"] = x->type;
            }
            ref["reference"] = true;
            elements.push_back(std::move(ref));
        } else if (const auto* e = std::get_if<model_graph::ElementNode>(&node)) {
            elements.push_back(element_json(*e, index));
        } else if (const auto* x = std::get_if<model_graph::ExternalNode>(&node)) {
            elements.push_back(external_json(*x));
        }
    }
    j["elements"] = std::move(elements);
    return j;
}

json element_json(const model_graph::ElementNode& node, const NodeIndex& index) {
    json j;
    j["id"] = node.id;
    j["name"] = node.name;
    j["type"] = node.type;
    j["attributes"] = attributes_json(node.attributes);
    json linked = json::array();
    for (const auto& d : node.linked_diagrams)
        linked.push_back(diagram_json(d, index));
    j["linkedDiagrams"] = std::move(linked);
    j["position"] = position_json(node.position);
    return j;
}

json package_json(const model_graph::PackageNode& node, const NodeIndex& index) {
    json j;
    j["name"] = node.name;
    j["type"] = "Package";
    json diagrams = json::array();
    for (const auto& d : node.diagrams)
        diagrams.push_back(diagram_json(d, index));
    j["diagrams"] = std::move(diagrams);
    return j;
}

} // namespace

json to_json(const model_graph::Graph& graph) {
    NodeIndex index;
    for (const auto& node : graph.nodes)
        if (auto id = model_graph::node_element_id(node)) index.emplace(*id, &node);

    json nodes = json::array();
    for (const auto& node : graph.nodes) {
        if (const auto* p = std::get_if<model_graph::PackageNode>(&node))
            nodes.push_back(package_json(*p, index));
        else if (const auto* e = std::get_if<model_graph::ElementNode>(&node))
            nodes.push_back(element_json(*e, index));
        else if (const auto* x = std::get_if<model_graph::ExternalNode>(&node))
            nodes.push_back(external_json(*x));
    }

    json edges = json::array();
    for (const auto& e : graph.edges) {
        json j;
        j["from"] = e.from;
        j["to"] = e.to;
        j["type"] = e.type;
        j["name"] = e.name;
        edges.push_back(std::move(j));
    }

    json out;
    out["nodes"] = std::move(nodes);
    out["edges"] = std::move(edges);
    return out;
}

std::string to_json_string(const model_graph::Graph& graph) {
    return to_json(graph).dump(4, ' ', true);
}

DownloadArtifact make_download_artifact(const model_graph::Graph& graph) {
    DownloadArtifact artifact;
    artifact.file_name = default_file_name;
    artifact.mime_type = json_mime_type;
    artifact.content = to_json_string(graph);
    return artifact;
}

bool write_artifact(const DownloadArtifact& artifact, const std::string& directory) {
    std::error_code ec;
    const std::filesystem::path dir = directory.empty() ? std::filesystem::path(".") : std::filesystem::path(directory);
    std::filesystem::create_directories(dir, ec);
    if (ec) return false;

    std::ofstream f(dir / artifact.file_name, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << artifact.content;
    return static_cast<bool>(f);
}

} // namespace graph_export
