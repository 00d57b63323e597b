/**
 * @file test_graph_builder.cpp
 * @brief Unit tests for graph construction from a root package
 *
 * Covers node/diagram/edge deduplication, classifier leaves, dangling ids,
 * cycles through linked diagrams and determinism of the output order.
 */

#include <gtest/gtest.h>
#include <graph_builder/graph_builder.hpp>
#include <graph_export/graph_json.hpp>
#include <model_fixture.hpp>
#include <model_loaders/sample_model.hpp>
#include <model_source/memory_repository.hpp>
#include <map>
#include <string>
#include <set>
#include <tuple>
#include <variant>

using namespace model_fixture;

namespace {

// Adds diagram links on top of a MemoryRepository, for diagrams reachable from
// more than one element.
class ExtraLinksRepository : public model_source::ModelRepository {
public:
    explicit ExtraLinksRepository(const model_source::MemoryRepository& base) : base_(base) {}

    void link(int element_id, int diagram_id) { links_[element_id].push_back(diagram_id); }

    std::vector<int> model_ids() const override { return base_.model_ids(); }
    std::optional<model_source::SourcePackage> package_by_id(int id) const override { return base_.package_by_id(id); }
    std::optional<model_source::SourceDiagram> diagram_by_id(int id) const override { return base_.diagram_by_id(id); }
    std::optional<model_source::SourceElement> element_by_id(int id) const override {
        auto e = base_.element_by_id(id);
        auto it = links_.find(id);
        if (e && it != links_.end())
            e->diagram_ids.insert(e->diagram_ids.end(), it->second.begin(), it->second.end());
        return e;
    }

private:
    const model_source::MemoryRepository& base_;
    std::map<int, std::vector<int>> links_;
};

model_graph::Graph build_for(const model_source::ModelRepository& repo, int package_id) {
    auto root = repo.package_by_id(package_id);
    EXPECT_TRUE(root.has_value());
    if (!root) return {};
    return graph_builder::build_graph(repo, *root);
}

const model_graph::PackageNode& package_node(const model_graph::Graph& graph) {
    return std::get<model_graph::PackageNode>(graph.nodes.at(0));
}

const model_graph::ElementNode* find_element(const model_graph::Graph& graph, int id) {
    for (const auto& n : graph.nodes)
        if (const auto* e = std::get_if<model_graph::ElementNode>(&n); e && e->id == id) return e;
    return nullptr;
}

const model_graph::ExternalNode* find_external(const model_graph::Graph& graph, int id) {
    for (const auto& n : graph.nodes)
        if (const auto* x = std::get_if<model_graph::ExternalNode>(&n); x && x->id == id) return x;
    return nullptr;
}

std::vector<int> member_ids(const model_graph::DiagramNode& diagram) {
    std::vector<int> out;
    for (const auto& m : diagram.elements) out.push_back(m.element_id);
    return out;
}

std::vector<int> node_ids(const model_graph::Graph& graph) {
    std::vector<int> out;
    for (const auto& n : graph.nodes)
        if (auto id = model_graph::node_element_id(n)) out.push_back(*id);
    return out;
}

// Walks the serialized graph, nested element records included, and counts every
// diagram record by id.
void count_diagram_records(const nlohmann::ordered_json& j, std::map<std::string, int>& counts) {
    if (j.is_object()) {
        if (j.contains("type") && j["type"] == "Diagram" && j.contains("id")) ++counts[j["id"].get<std::string>()];
        for (const auto& item : j.items()) count_diagram_records(item.value(), counts);
    } else if (j.is_array()) {
        for (const auto& item : j) count_diagram_records(item, counts);
    }
}

// Package P (id 2) under model root 1, main diagram 10 holding A (1) and B (2).
model_source::MemoryRepository two_element_model() {
    model_source::MemoryRepository repo;
    repo.add_package(package(1, 0, "Model"));
    repo.add_package(package(2, 1, "P"));
    repo.add_element(element(1, "A", "Class", 0, 2));
    repo.add_element(element(2, "B", "Class", 0, 2));
    repo.add_diagram(diagram(10, 2, 0, "D", { placed_at(1, 10, 110, -10, -60), placed_at(2, 200, 300, -10, -60) }));
    return repo;
}

} // namespace

TEST(GraphBuilderTest, PackageWithoutDiagramsYieldsEmptyGraph) {
    model_source::MemoryRepository repo;
    repo.add_package(package(1, 0, "Model"));
    repo.add_package(package(2, 1, "Empty"));
    repo.add_element(element(1, "Unplaced"));

    auto graph = build_for(repo, 2);
    EXPECT_TRUE(graph.nodes.empty());
    EXPECT_TRUE(graph.edges.empty());
}

TEST(GraphBuilderTest, TwoElementsWithAssociation) {
    auto repo = two_element_model();
    repo.add_connector(connector(100, 1, 2, "Association", "uses"));

    auto graph = build_for(repo, 2);
    ASSERT_EQ(graph.nodes.size(), 3u);

    const auto& pkg = package_node(graph);
    EXPECT_EQ(pkg.name, "P");
    ASSERT_EQ(pkg.diagrams.size(), 1u);
    EXPECT_EQ(pkg.diagrams[0].diagram_id, 10);
    EXPECT_EQ(pkg.diagrams[0].name, "D");
    EXPECT_EQ(member_ids(pkg.diagrams[0]), (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 1, 2 }));

    ASSERT_EQ(graph.edges.size(), 1u);
    EXPECT_EQ(graph.edges[0].from, 1);
    EXPECT_EQ(graph.edges[0].to, 2);
    EXPECT_EQ(graph.edges[0].type, "Association");
    EXPECT_EQ(graph.edges[0].name, "uses");
}

TEST(GraphBuilderTest, ElementCarriesPlacementAndAttributes) {
    auto repo = two_element_model();
    auto a = element(1, "A", "Class", 0, 2);
    a.attributes = { { 1, "count", "int", "0" }, { 2, "label", "string", "" }, { 2, "label", "string", "" } };
    repo.add_element(a);

    auto graph = build_for(repo, 2);
    const auto* node = find_element(graph, 1);
    ASSERT_NE(node, nullptr);
    ASSERT_TRUE(node->position.has_value());
    EXPECT_EQ(node->position->left, 10);
    EXPECT_EQ(node->position->right, 110);
    EXPECT_EQ(node->position->top, -10);
    EXPECT_EQ(node->position->bottom, -60);

    ASSERT_EQ(node->attributes.size(), 3u);
    EXPECT_EQ(node->attributes[0].name, "count");
    EXPECT_EQ(node->attributes[0].type, "int");
    EXPECT_EQ(node->attributes[0].default_value, "0");
    EXPECT_EQ(node->attributes[2].id, 2);
}

TEST(GraphBuilderTest, MissingPlacementElementIsSkipped) {
    auto repo = two_element_model();
    repo.add_diagram(diagram(10, 2, 0, "D", { placed(1), placed(404), placed(2) }));

    auto graph = build_for(repo, 2);
    EXPECT_EQ(member_ids(package_node(graph).diagrams[0]), (std::vector<int>{ 1, 2 }));
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 1, 2 }));
}

TEST(GraphBuilderTest, OnlyFirstPackageDiagramIsExpanded) {
    auto repo = two_element_model();
    repo.add_element(element(3, "OnSecondDiagram"));
    repo.add_diagram(diagram(11, 2, 0, "Second", { placed(3) }));

    auto graph = build_for(repo, 2);
    EXPECT_EQ(package_node(graph).diagrams.size(), 1u);
    EXPECT_EQ(find_element(graph, 3), nullptr);
}

TEST(GraphBuilderTest, ClassifierBecomesUnexpandedExternalNode) {
    model_source::MemoryRepository repo;
    repo.add_package(package(1, 0, "Model"));
    repo.add_package(package(2, 1, "P"));
    repo.add_package(package(3, 1, "Types"));
    repo.add_element(element(3, "C", "Class", 9, 2));
    auto x = element(9, "X", "Enumeration", 0, 3);
    x.attributes = { { 1, "Red", "", "" }, { 2, "Green", "", "" } };
    repo.add_element(x);
    repo.add_element(element(4, "Y", "Class", 0, 3));
    repo.add_connector(connector(200, 9, 4, "Association", "x-to-y"));
    repo.add_diagram(diagram(10, 2, 0, "D", { placed(3) }));
    repo.add_diagram(diagram(11, 3, 9, "X details", { placed(4) }));

    auto graph = build_for(repo, 2);
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 9, 3 }));

    const auto* external = find_external(graph, 9);
    ASSERT_NE(external, nullptr);
    EXPECT_EQ(external->type, "Enumeration");
    ASSERT_TRUE(external->package.has_value());
    EXPECT_EQ(*external->package, "Types");
    ASSERT_EQ(external->attributes.size(), 2u);
    EXPECT_EQ(external->attributes[1].name, "Green");

    EXPECT_EQ(find_element(graph, 4), nullptr);
    EXPECT_TRUE(graph.edges.empty());
}

TEST(GraphBuilderTest, ClassifierWithUnknownPackageHasNoPackageName) {
    auto repo = two_element_model();
    repo.add_element(element(1, "A", "Class", 9, 2));
    repo.add_element(element(9, "X", "Enumeration", 0, 77));

    auto graph = build_for(repo, 2);
    const auto* external = find_external(graph, 9);
    ASSERT_NE(external, nullptr);
    EXPECT_FALSE(external->package.has_value());
}

TEST(GraphBuilderTest, UnresolvedClassifierIsIgnored) {
    auto repo = two_element_model();
    repo.add_element(element(1, "A", "Class", 555, 2));

    auto graph = build_for(repo, 2);
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 1, 2 }));
}

TEST(GraphBuilderTest, ClassifierPlacedLaterIsReusedNotRebuilt) {
    auto repo = two_element_model();
    repo.add_element(element(1, "A", "Class", 2, 2));

    auto graph = build_for(repo, 2);
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 2, 1 }));
    EXPECT_NE(find_external(graph, 2), nullptr);
    EXPECT_EQ(find_element(graph, 2), nullptr);

    const auto& members = package_node(graph).diagrams[0].elements;
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[1].element_id, 2);
    EXPECT_TRUE(members[1].reference);
}

TEST(GraphBuilderTest, LinkedDiagramIsNestedUnderOwningElement) {
    auto repo = two_element_model();
    repo.add_element(element(3, "Detail"));
    repo.add_diagram(diagram(20, 2, 1, "A details", { placed_at(3, 0, 50, 0, -20) }));

    auto graph = build_for(repo, 2);
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 3, 1, 2 }));

    const auto* a = find_element(graph, 1);
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->linked_diagrams.size(), 1u);
    EXPECT_EQ(a->linked_diagrams[0].diagram_id, 20);
    EXPECT_EQ(a->linked_diagrams[0].name, "A details");
    EXPECT_EQ(member_ids(a->linked_diagrams[0]), (std::vector<int>{ 3 }));

    const auto* detail = find_element(graph, 3);
    ASSERT_NE(detail, nullptr);
    ASSERT_TRUE(detail->position.has_value());
    EXPECT_EQ(detail->position->right, 50);
}

TEST(GraphBuilderTest, ElementsAlreadyVisitedAreListedAsReferences) {
    auto repo = two_element_model();
    // A's child diagram shows B and A itself; B is also on the main diagram.
    repo.add_diagram(diagram(20, 2, 1, "A details", { placed(2), placed(1) }));

    auto graph = build_for(repo, 2);
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 2, 1 }));

    const auto* a = find_element(graph, 1);
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->linked_diagrams.size(), 1u);
    const auto& nested = a->linked_diagrams[0].elements;
    ASSERT_EQ(nested.size(), 2u);
    EXPECT_EQ(nested[0].element_id, 2);
    EXPECT_FALSE(nested[0].reference);
    // A is still being built when its own child diagram reaches it.
    EXPECT_EQ(nested[1].element_id, 1);
    EXPECT_TRUE(nested[1].reference);

    // B was built inside A's child diagram; the main diagram only refers to it.
    const auto& main_members = package_node(graph).diagrams[0].elements;
    ASSERT_EQ(main_members.size(), 2u);
    EXPECT_FALSE(main_members[0].reference);
    EXPECT_EQ(main_members[1].element_id, 2);
    EXPECT_TRUE(main_members[1].reference);
}

TEST(GraphBuilderTest, SharedDiagramIsExpandedOnce) {
    auto base = two_element_model();
    base.add_element(element(3, "Shared member"));
    base.add_diagram(diagram(30, 2, 1, "Shared", { placed(3) }));
    ExtraLinksRepository repo(base);
    repo.link(2, 30);
    // Main diagram linked back from B must not be expanded again either.
    repo.link(2, 10);

    auto graph = build_for(repo, 2);

    std::map<std::string, int> expansions;
    count_diagram_records(graph_export::to_json(graph), expansions);
    EXPECT_EQ(expansions.size(), 2u);
    EXPECT_EQ(expansions["D10"], 1);
    EXPECT_EQ(expansions["D30"], 1);
    EXPECT_EQ(find_element(graph, 1)->linked_diagrams.size(), 1u);
    EXPECT_TRUE(find_element(graph, 2)->linked_diagrams.empty());
}

TEST(GraphBuilderTest, ConnectorsSharingEndsAndTypeCollapse) {
    auto repo = two_element_model();
    repo.add_connector(connector(100, 1, 2, "Association", "first"));
    repo.add_connector(connector(101, 1, 2, "Association", "second"));
    repo.add_connector(connector(102, 1, 2, "Dependency", "depends"));
    repo.add_connector(connector(103, 2, 1, "Association", "reverse"));

    auto graph = build_for(repo, 2);
    ASSERT_EQ(graph.edges.size(), 3u);
    EXPECT_EQ(graph.edges[0].name, "first");
    EXPECT_EQ(graph.edges[1].type, "Dependency");
    EXPECT_EQ(graph.edges[2].from, 2);
    EXPECT_EQ(graph.edges[2].to, 1);

    std::set<std::tuple<int, int, std::string>> keys;
    for (const auto& e : graph.edges)
        EXPECT_TRUE(keys.emplace(e.from, e.to, e.type).second);
}

TEST(GraphBuilderTest, ConnectorWithDanglingEndIsDropped) {
    auto repo = two_element_model();
    repo.add_connector(connector(100, 1, 404, "Association", "broken"));
    repo.add_connector(connector(101, 404, 2, "Association", "broken"));

    auto graph = build_for(repo, 2);
    EXPECT_TRUE(graph.edges.empty());
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 1, 2 }));
}

TEST(GraphBuilderTest, ConnectorsBetweenUnvisitedElementsAreIgnored) {
    auto repo = two_element_model();
    repo.add_element(element(5, "Elsewhere"));
    repo.add_element(element(6, "Also elsewhere"));
    repo.add_connector(connector(100, 5, 6, "Association", "hidden"));

    auto graph = build_for(repo, 2);
    EXPECT_TRUE(graph.edges.empty());
}

TEST(GraphBuilderTest, NoElementIdAppearsTwice) {
    auto repo = model_loaders::generate_sample_repository();
    auto graph = build_for(repo, 2);

    std::set<int> seen;
    for (int id : node_ids(graph))
        EXPECT_TRUE(seen.insert(id).second) << "duplicate node " << id;
}

TEST(GraphBuilderTest, SampleModelOrderingPackage) {
    auto repo = model_loaders::generate_sample_repository();
    auto graph = build_for(repo, 2);

    const auto& pkg = package_node(graph);
    EXPECT_EQ(pkg.name, "Ordering");
    EXPECT_EQ(member_ids(pkg.diagrams[0]), (std::vector<int>{ 10, 11 }));
    EXPECT_EQ(node_ids(graph), (std::vector<int>{ 20, 10, 12, 11 }));
    ASSERT_NE(find_external(graph, 20), nullptr);
    EXPECT_EQ(*find_external(graph, 20)->package, "Shared Types");

    ASSERT_EQ(graph.edges.size(), 3u);
    EXPECT_EQ(graph.edges[0].name, "places");
    EXPECT_EQ(graph.edges[1].name, "contains");
    EXPECT_EQ(graph.edges[2].from, 13);
    EXPECT_EQ(graph.edges[2].to, 11);
}

TEST(GraphBuilderTest, RepeatedBuildsAreIdentical) {
    auto repo = model_loaders::generate_sample_repository();
    auto first = graph_export::to_json_string(build_for(repo, 2));
    auto second = graph_export::to_json_string(build_for(repo, 2));
    EXPECT_EQ(first, second);
}

TEST(GraphBuilderTest, DiagramRecordsAreUniqueAcrossNesting) {
    auto repo = model_loaders::generate_sample_repository();
    auto graph = build_for(repo, 2);

    std::map<std::string, int> records;
    count_diagram_records(graph_export::to_json(graph), records);
    EXPECT_EQ(records.size(), 2u);
    EXPECT_EQ(records["D100"], 1);
    // Child diagram of Order, nested inside the main diagram's Order record.
    EXPECT_EQ(records["D101"], 1);
}
