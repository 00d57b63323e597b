#include <graph_builder/graph_builder.hpp>
#include <set>
#include <string>
#include <tuple>
#include <unordered_set>
#include <utility>
#include <vector>

namespace graph_builder {

namespace {

// (source element id, target element id, connector type)
using EdgeKey = std::tuple<int, int, std::string>;

struct TraversalContext {
    explicit TraversalContext(const model_source::ModelRepository& repo) : repository(repo) {}

    const model_source::ModelRepository& repository;
    model_graph::Graph graph;
    // Marked on entry, before the element's own traversal.
    std::unordered_set<int> visited_elements;
    std::unordered_set<int> visited_diagrams;
    std::set<EdgeKey> seen_edges;
};

model_graph::DiagramMember process_element(TraversalContext& ctx,
    const model_source::SourceElement& element, const model_source::DiagramObject* placement);

std::vector<model_graph::AttributeRecord> build_attributes(const model_source::SourceElement& element) {
    std::vector<model_graph::AttributeRecord> out;
    out.reserve(element.attributes.size());
    for (const auto& a : element.attributes)
        out.push_back(model_graph::AttributeRecord{ a.id, a.name, a.type, a.default_value });
    return out;
}

model_graph::Position position_from(const model_source::DiagramObject& placement) {
    model_graph::Position p;
    p.left = placement.left;
    p.right = placement.right;
    p.top = placement.top;
    p.bottom = placement.bottom;
    return p;
}

// Placements in order; placements whose element does not resolve are dropped.
std::vector<model_graph::DiagramMember> collect_members(TraversalContext& ctx,
    const model_source::SourceDiagram& diagram)
{
    std::vector<model_graph::DiagramMember> members;
    for (const auto& object : diagram.objects) {
        auto element = ctx.repository.element_by_id(object.element_id);
        if (!element) continue;
        members.push_back(process_element(ctx, *element, &object));
    }
    return members;
}

void process_external_classifier(TraversalContext& ctx, int classifier_id) {
    auto classifier = ctx.repository.element_by_id(classifier_id);
    if (!classifier || ctx.visited_elements.count(classifier->id) != 0) return;

    model_graph::ExternalNode node;
    node.id = classifier->id;
    node.name = classifier->name;
    node.type = classifier->type;
    if (auto package = ctx.repository.package_by_id(classifier->package_id))
        node.package = package->name;
    node.attributes = build_attributes(*classifier);

    ctx.visited_elements.insert(node.id);
    ctx.graph.nodes.push_back(std::move(node));
}

void expand_linked_diagrams(TraversalContext& ctx, const model_source::SourceElement& element,
    model_graph::ElementNode& node)
{
    for (int diagram_id : element.diagram_ids) {
        // First owner keeps the diagram; later owners do not list it.
        if (ctx.visited_diagrams.count(diagram_id) != 0) continue;
        auto diagram = ctx.repository.diagram_by_id(diagram_id);
        if (!diagram) continue;
        ctx.visited_diagrams.insert(diagram_id);

        model_graph::DiagramNode diagram_node;
        diagram_node.diagram_id = diagram->id;
        diagram_node.name = diagram->name;
        diagram_node.elements = collect_members(ctx, *diagram);
        node.linked_diagrams.push_back(std::move(diagram_node));
    }
}

void add_edges_from_element(TraversalContext& ctx, const model_source::SourceElement& element) {
    for (const auto& connector : element.connectors) {
        if (!ctx.repository.has_element(connector.client_id) || !ctx.repository.has_element(connector.supplier_id))
            continue;

        // Distinct connectors sharing ends and type collapse into one edge.
        if (!ctx.seen_edges.emplace(connector.client_id, connector.supplier_id, connector.type).second) continue;
        ctx.graph.edges.push_back(
            model_graph::Edge{ connector.client_id, connector.supplier_id, connector.type, connector.name });
    }
}

model_graph::DiagramMember process_element(TraversalContext& ctx,
    const model_source::SourceElement& element, const model_source::DiagramObject* placement)
{
    if (ctx.visited_elements.count(element.id) != 0)
        return model_graph::DiagramMember{ element.id, true };
    ctx.visited_elements.insert(element.id);

    model_graph::ElementNode node;
    node.id = element.id;
    node.name = element.name;
    node.type = element.type;
    node.attributes = build_attributes(element);
    if (placement)
        node.position = position_from(*placement);

    if (element.classifier_id != 0)
        process_external_classifier(ctx, element.classifier_id);
    expand_linked_diagrams(ctx, element, node);
    add_edges_from_element(ctx, element);

    ctx.graph.nodes.push_back(std::move(node));
    return model_graph::DiagramMember{ element.id, false };
}

} // namespace

model_graph::Graph build_graph(const model_source::ModelRepository& repository,
    const model_source::SourcePackage& root_package)
{
    TraversalContext ctx(repository);
    if (root_package.diagram_ids.empty()) return ctx.graph;

    auto main_diagram = repository.diagram_by_id(root_package.diagram_ids.front());
    if (!main_diagram) return ctx.graph;
    ctx.visited_diagrams.insert(main_diagram->id);

    model_graph::DiagramNode main_node;
    main_node.diagram_id = main_diagram->id;
    main_node.name = main_diagram->name;
    main_node.elements = collect_members(ctx, *main_diagram);

    model_graph::PackageNode package_node;
    package_node.name = root_package.name;
    package_node.diagrams.push_back(std::move(main_node));
    ctx.graph.nodes.insert(ctx.graph.nodes.begin(), model_graph::GraphNode(std::move(package_node)));
    return std::move(ctx.graph);
}

} // namespace graph_builder
